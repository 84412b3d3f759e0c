// ==============================================================================
// fileprompt/session.hpp - Один запуск склейки файлов
// ==============================================================================
//
// Назначение:
// - Обработка входных путей по порядку (файл / директория / не существует)
// - Связка обхода (io::walk_directory), чтения (io::read_text_file) и
//   сериализации (render::Renderer)
// - Обёртка <documents> для XML
// - Диагностика пропусков через output::Writer
//
// Session создаётся заново на каждый запуск: счётчик документов начинается с 1.
//
// ==============================================================================

#ifndef FILEPROMPT_SESSION_HPP
#define FILEPROMPT_SESSION_HPP

#include "fileprompt/cli.hpp"
#include "fileprompt/discovery.hpp"
#include "fileprompt/output.hpp"
#include "fileprompt/render.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace fileprompt::app {

// ----------------------------------------------------------------------------
// SessionOptions
// ----------------------------------------------------------------------------

struct SessionOptions {
    io::WalkOptions walk;
    render::Format format = render::Format::Default;
    bool line_numbers = false;
};

/// Собрать параметры запуска из разобранной командной строки
SessionOptions session_options_from(const cli::RunCommand& cmd);

// ----------------------------------------------------------------------------
// Session
// ----------------------------------------------------------------------------

class Session {
public:
    Session(SessionOptions options, output::Writer& writer);

    /// Обработать входные пути по порядку.
    ///
    /// Несуществующий путь и нечитаемый файл - диагностика и продолжение.
    /// @throws std::runtime_error если директорию или .gitignore прочитать нельзя
    void process(const std::vector<std::filesystem::path>& inputs);

    /// Количество выведенных документов
    std::size_t documents_written() const { return documents_written_; }

    /// Количество файлов, пропущенных из-за ошибок чтения/декодирования
    std::size_t files_skipped() const { return files_skipped_; }

    /// Количество несуществующих входных путей
    std::size_t paths_missing() const { return paths_missing_; }

private:
    void process_path(const std::filesystem::path& path);

    /// Прочитать кандидата и вывести документ (или диагностику)
    void emit(const std::filesystem::path& path);

    SessionOptions options_;
    output::Writer& writer_;
    render::Renderer renderer_;

    std::size_t documents_written_ = 0;
    std::size_t files_skipped_ = 0;
    std::size_t paths_missing_ = 0;
};

}  // namespace fileprompt::app

#endif  // FILEPROMPT_SESSION_HPP
