// ==============================================================================
// fileprompt/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv (длинные/короткие опции, --name=value, кластеры -cn)
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
// - Список путей из stdin (через пробельные символы или NUL)
//
// ==============================================================================

#ifndef FILEPROMPT_CLI_HPP
#define FILEPROMPT_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fileprompt::cli {

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Основной режим: склеить файлы в один вывод
struct RunCommand {
    std::vector<std::filesystem::path> paths;     // [PATHS]...
    std::vector<std::string> extensions;          // -e, --extension
    bool include_hidden = false;                  // --include-hidden
    bool ignore_files_only = false;               // --ignore-files-only
    bool ignore_gitignore = false;                // --ignore-gitignore
    std::vector<std::string> ignore_patterns;     // --ignore
    std::optional<std::filesystem::path> output;  // -o, --output
    bool cxml = false;                            // -c, --cxml
    bool markdown = false;                        // -m, --markdown
    bool line_numbers = false;                    // -n, --line-numbers
    bool null_separator = false;                  // -0, --null
    int verbose = 0;                              // -v (repeatable)
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<RunCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

/// Разбить список путей из stdin: по NUL (пустые элементы отбрасываются)
/// или по пробельным символам ASCII
std::vector<std::filesystem::path> split_stdin_paths(std::string_view content,
                                                     bool null_separator);

/// Прочитать пути из stdin, если stdin не терминал; иначе пустой список
std::vector<std::filesystem::path> read_stdin_paths(bool null_separator);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM_NAME = "files-to-prompt";

constexpr const char* VERSION = "0.6.0";

constexpr const char* ABOUT =
    "Concatenate a directory full of files into a single prompt for use with LLMs";

}  // namespace fileprompt::cli

#endif  // FILEPROMPT_CLI_HPP
