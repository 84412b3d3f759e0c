// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI: фиксированный формат help и ошибок использования.
//
// ==============================================================================

#include "fileprompt/cli.hpp"

#include "fileprompt/platform.hpp"

#include <iostream>
#include <iterator>
#include <utility>

namespace fileprompt::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE = "Usage: files-to-prompt [OPTIONS] [PATHS]...";

enum class OptionId {
    Extension,
    IncludeHidden,
    IgnoreFilesOnly,
    IgnoreGitignore,
    Ignore,
    Output,
    Cxml,
    Markdown,
    LineNumbers,
    Null,
    Verbose,
    Help,
    Version
};

struct OptionSpec {
    const char* long_name;
    char short_name;  // '\0' если короткой формы нет
    const char* value_name;  // nullptr для флагов
    OptionId id;
};

constexpr OptionSpec OPTIONS[] = {
    {"extension", 'e', "EXT", OptionId::Extension},
    {"include-hidden", '\0', nullptr, OptionId::IncludeHidden},
    {"ignore-files-only", '\0', nullptr, OptionId::IgnoreFilesOnly},
    {"ignore-gitignore", '\0', nullptr, OptionId::IgnoreGitignore},
    {"ignore", '\0', "PATTERN", OptionId::Ignore},
    {"output", 'o', "FILE", OptionId::Output},
    {"cxml", 'c', nullptr, OptionId::Cxml},
    {"markdown", 'm', nullptr, OptionId::Markdown},
    {"line-numbers", 'n', nullptr, OptionId::LineNumbers},
    {"null", '0', nullptr, OptionId::Null},
    {"verbose", 'v', nullptr, OptionId::Verbose},
    {"help", 'h', nullptr, OptionId::Help},
    {"version", 'V', nullptr, OptionId::Version},
};

const OptionSpec* find_long(std::string_view name) {
    for (const auto& spec : OPTIONS) {
        if (name == spec.long_name) {
            return &spec;
        }
    }
    return nullptr;
}

const OptionSpec* find_short(char c) {
    for (const auto& spec : OPTIONS) {
        if (spec.short_name != '\0' && spec.short_name == c) {
            return &spec;
        }
    }
    return nullptr;
}

/// Ошибка использования: error + Usage + подсказка
std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n" + USAGE + "\n\nFor more information, try '--help'.\n";
}

ParseResult usage_error(const std::string& error_msg) {
    ParseResult result;
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg);
    return result;
}

ParseResult missing_value(const OptionSpec& spec) {
    ParseResult result;
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = std::string("error: a value is required for '--") +
                                       spec.long_name + " <" + spec.value_name +
                                       ">' but none was supplied\n\n"
                                       "For more information, try '--help'.\n";
    return result;
}

/// Значение в следующем аргументе; аргумент вида "-x" значением не считается
bool looks_like_option(std::string_view arg) {
    return arg.size() > 1 && arg[0] == '-';
}

/// Применить опцию к команде. Возвращает false, если опция завершает разбор
/// (--help / --version); тогда out заполнен.
bool apply(RunCommand& cmd, const OptionSpec& spec, std::string_view value, ParseResult& out) {
    switch (spec.id) {
    case OptionId::Extension:
        cmd.extensions.emplace_back(value);
        break;
    case OptionId::IncludeHidden:
        cmd.include_hidden = true;
        break;
    case OptionId::IgnoreFilesOnly:
        cmd.ignore_files_only = true;
        break;
    case OptionId::IgnoreGitignore:
        cmd.ignore_gitignore = true;
        break;
    case OptionId::Ignore:
        cmd.ignore_patterns.emplace_back(value);
        break;
    case OptionId::Output:
        cmd.output = platform::path_from_utf8(value);
        break;
    case OptionId::Cxml:
        cmd.cxml = true;
        break;
    case OptionId::Markdown:
        cmd.markdown = true;
        break;
    case OptionId::LineNumbers:
        cmd.line_numbers = true;
        break;
    case OptionId::Null:
        cmd.null_separator = true;
        break;
    case OptionId::Verbose:
        cmd.verbose++;
        break;
    case OptionId::Help:
        out.ok = true;
        out.command = HelpCommand{};
        return false;
    case OptionId::Version:
        out.ok = true;
        out.command = VersionCommand{};
        return false;
    }
    return true;
}

bool is_ascii_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM_NAME) + " " + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: files-to-prompt [OPTIONS] [PATHS]...\n"
           "\n"
           "Arguments:\n"
           "  [PATHS]...  Paths to files or directories\n"
           "\n"
           "Options:\n"
           "  -e, --extension <EXT>    File extensions to include\n"
           "      --include-hidden     Include files and folders starting with .\n"
           "      --ignore-files-only  --ignore option only ignores files\n"
           "      --ignore-gitignore   Ignore .gitignore files and include all files\n"
           "      --ignore <PATTERN>   List of patterns to ignore\n"
           "  -o, --output <FILE>      Output to a file instead of stdout\n"
           "  -c, --cxml               Output in XML-ish format suitable for Claude's long "
           "context window\n"
           "  -m, --markdown           Output Markdown with fenced code blocks\n"
           "  -n, --line-numbers       Add line numbers to the output\n"
           "  -0, --null               Use NUL character as separator when reading from stdin\n"
           "  -v, --verbose...         Print diagnostic output (-vv traces skipped entries)\n"
           "  -h, --help               Print help\n"
           "  -V, --version            Print version\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    RunCommand cmd;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Позиционный путь: после "--", "-" или без ведущего '-'
        if (options_done || arg.size() < 2 || arg[0] != '-') {
            cmd.paths.push_back(platform::path_from_utf8(arg));
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg[1] == '-') {
            // --name или --name=value
            std::string_view body = arg.substr(2);
            std::string_view name = body;
            std::optional<std::string_view> inline_value;
            size_t eq = body.find('=');
            if (eq != std::string_view::npos) {
                name = body.substr(0, eq);
                inline_value = body.substr(eq + 1);
            }

            const OptionSpec* spec = find_long(name);
            if (spec == nullptr) {
                return usage_error("error: unexpected argument '" + std::string(arg) + "' found");
            }

            std::string_view value;
            if (spec->value_name != nullptr) {
                if (inline_value.has_value()) {
                    value = *inline_value;
                } else if (i + 1 < argc && !looks_like_option(argv[i + 1])) {
                    value = argv[++i];
                } else {
                    return missing_value(*spec);
                }
            } else if (inline_value.has_value()) {
                return usage_error("error: unexpected value '" + std::string(*inline_value) +
                                   "' for '--" + spec->long_name +
                                   "' found; no more were expected");
            }

            if (!apply(cmd, *spec, value, result)) {
                return result;
            }
            continue;
        }

        // Кластер коротких опций: -cn, -epy, -e py
        for (size_t j = 1; j < arg.size(); ++j) {
            const OptionSpec* spec = find_short(arg[j]);
            if (spec == nullptr) {
                return usage_error("error: unexpected argument '-" + std::string(1, arg[j]) +
                                   "' found");
            }

            if (spec->value_name != nullptr) {
                std::string_view value = arg.substr(j + 1);
                if (!value.empty() && value.front() == '=') {
                    value.remove_prefix(1);
                }
                if (value.empty()) {
                    if (i + 1 < argc && !looks_like_option(argv[i + 1])) {
                        value = argv[++i];
                    } else {
                        return missing_value(*spec);
                    }
                }
                if (!apply(cmd, *spec, value, result)) {
                    return result;
                }
                break;  // остаток кластера был значением
            }

            if (!apply(cmd, *spec, {}, result)) {
                return result;
            }
        }
    }

    result.ok = true;
    result.command = std::move(cmd);
    return result;
}

// ----------------------------------------------------------------------------
// Пути из stdin
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> split_stdin_paths(std::string_view content,
                                                     bool null_separator) {
    std::vector<std::filesystem::path> paths;

    size_t pos = 0;
    while (pos < content.size()) {
        size_t end = pos;
        if (null_separator) {
            end = content.find('\0', pos);
            if (end == std::string_view::npos) {
                end = content.size();
            }
        } else {
            while (pos < content.size() && is_ascii_whitespace(content[pos])) {
                ++pos;
            }
            end = pos;
            while (end < content.size() && !is_ascii_whitespace(content[end])) {
                ++end;
            }
        }

        if (end > pos) {
            paths.push_back(platform::path_from_utf8(content.substr(pos, end - pos)));
        }
        pos = end + 1;
    }

    return paths;
}

std::vector<std::filesystem::path> read_stdin_paths(bool null_separator) {
    // Интерактивный терминал: список путей не ожидается
    if (platform::is_tty_stdin()) {
        return {};
    }

    std::string content((std::istreambuf_iterator<char>(std::cin)),
                        std::istreambuf_iterator<char>());
    return split_stdin_paths(content, null_separator);
}

}  // namespace fileprompt::cli
