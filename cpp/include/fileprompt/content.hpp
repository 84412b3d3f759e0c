// ==============================================================================
// fileprompt/content.hpp - Чтение текстового содержимого файла
// ==============================================================================
//
// Назначение:
// - Чтение файла целиком
// - Проверка UTF-8: невалидный текст - ошибка Decode, а не исключение
// - ContentResult в стиле ok/error для решения "пропустить с диагностикой"
//
// ==============================================================================

#ifndef FILEPROMPT_CONTENT_HPP
#define FILEPROMPT_CONTENT_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace fileprompt::io {

// ----------------------------------------------------------------------------
// ContentError
// ----------------------------------------------------------------------------

enum class ContentErrorKind {
    NotFound,          // Файл не найден
    PermissionDenied,  // Нет доступа
    Decode,            // Содержимое не является валидным UTF-8
    IoError            // Прочие ошибки ввода-вывода
};

const char* content_error_kind_to_string(ContentErrorKind kind);

struct ContentError {
    ContentErrorKind kind = ContentErrorKind::IoError;
    std::string message;

    /// "<kind>: <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// ContentResult
// ----------------------------------------------------------------------------

struct ContentResult {
    bool ok = false;
    std::string content;
    ContentError error;
};

/// Прочитать файл как UTF-8 текст
ContentResult read_text_file(const std::filesystem::path& path);

/// Строгая проверка UTF-8 (без overlong, суррогатов и значений > U+10FFFF)
bool is_valid_utf8(std::string_view data);

}  // namespace fileprompt::io

#endif  // FILEPROMPT_CONTENT_HPP
