// ==============================================================================
// fileprompt/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Перенаправление документов в файл (--output)
// - Диагностика с префиксами [!] / [x] / [*] / [~]
// - Цветные префиксы (ANSI escape codes) только для TTY
//
// ==============================================================================

#ifndef FILEPROMPT_OUTPUT_HPP
#define FILEPROMPT_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fileprompt::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    int verbose = 0;  // -v: уровень подробности (0..2+)

    // Путь для вывода (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток. Stdout уходит в файл, если он открыт.
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами (всегда stderr)
    // -------------------------------------------------------------------------

    /// "[!] <message>"
    void warn(std::string_view message);

    /// "[x] <message>"
    void error(std::string_view message);

    /// "[*] <message>", только при verbose > 0
    void debug(std::string_view message);

    /// "[~] <message>", только при verbose > 1
    void trace(std::string_view message);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();

    /// Закрыть файл вывода
    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

    /// Причина последней неудачи open_output_file() (strerror)
    const std::string& output_error() const { return output_error_; }

    /// Была ли ошибка записи документов (stdout или файл вывода).
    /// Ошибка "липкая": фиксируется первая, последующие не перезаписывают её.
    bool has_write_error() const { return !write_error_.empty(); }

    /// Причина первой ошибки записи (strerror)
    const std::string& write_error() const { return write_error_; }

private:
    void write_impl(Stream s, std::string_view bytes);

    /// Запомнить первую ошибку записи в приёмник документов
    void record_write_error(int err);

    /// Приёмник документов: файл вывода или stdout
    FILE* sink() const;

    /// Записать префикс диагностики, цветной при TTY
    void write_prefix(std::string_view prefix, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;  // Файл для вывода (если --output)
    std::string output_error_;
    std::string write_error_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace fileprompt::output

#endif  // FILEPROMPT_OUTPUT_HPP
