// ==============================================================================
// session.cpp - Один запуск склейки файлов
// ==============================================================================

#include "fileprompt/session.hpp"

#include "fileprompt/content.hpp"
#include "fileprompt/platform.hpp"

#include <system_error>
#include <utility>

namespace fileprompt::app {

SessionOptions session_options_from(const cli::RunCommand& cmd) {
    SessionOptions options;
    options.walk.extensions = cmd.extensions;
    options.walk.include_hidden = cmd.include_hidden;
    options.walk.ignore_files_only = cmd.ignore_files_only;
    options.walk.ignore_gitignore = cmd.ignore_gitignore;
    options.walk.ignore_patterns = cmd.ignore_patterns;
    options.format = render::select_format(cmd.cxml, cmd.markdown);
    options.line_numbers = cmd.line_numbers;
    return options;
}

Session::Session(SessionOptions options, output::Writer& writer)
    : options_(std::move(options)),
      writer_(writer),
      renderer_(options_.format, options_.line_numbers) {}

void Session::process(const std::vector<std::filesystem::path>& inputs) {
    writer_.debug(std::string("Output format: ") + render::format_to_string(options_.format) +
                  ", inputs: " + std::to_string(inputs.size()));

    // <documents> только если был хотя бы один входной путь
    if (!inputs.empty()) {
        writer_.write(output::Stream::Stdout, renderer_.begin_documents());
    }

    for (const auto& input : inputs) {
        process_path(input);
    }

    if (!inputs.empty()) {
        writer_.write(output::Stream::Stdout, renderer_.end_documents());
    }

    writer_.flush();
}

void Session::process_path(const std::filesystem::path& path) {
    const std::string display = platform::path_to_utf8(path);

    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        writer_.warn("Path does not exist: " + display);
        ++paths_missing_;
        return;
    }

    // Файл верхнего уровня выводится без фильтров
    if (std::filesystem::is_regular_file(status)) {
        emit(path);
        return;
    }

    if (!std::filesystem::is_directory(status)) {
        writer_.debug("Not a regular file or directory, skipping: " + display);
        return;
    }

    io::IgnoreRuleSet seed = io::seed_rules(path, options_.walk);
    writer_.debug("Walking " + display + " (" + std::to_string(seed.size()) +
                  " inherited gitignore rules)");

    io::walk_directory(
        path, options_.walk, seed, [this](const std::filesystem::path& file) { emit(file); },
        [this](const std::filesystem::path& skipped, io::RejectReason reason) {
            writer_.trace("Skipping " + platform::path_to_utf8(skipped) + " (" +
                          io::reject_reason_to_string(reason) + ")");
        });
}

void Session::emit(const std::filesystem::path& path) {
    io::ContentResult result = io::read_text_file(path);
    if (!result.ok) {
        const std::string display = platform::path_to_utf8(path);
        if (result.error.kind == io::ContentErrorKind::Decode) {
            writer_.warn("Skipping file " + display + " due to UnicodeDecodeError");
        } else {
            writer_.warn("Skipping file " + display + " due to error: " + result.error.message);
        }
        ++files_skipped_;
        return;
    }

    writer_.write(output::Stream::Stdout, renderer_.render(path, result.content));
    ++documents_written_;
}

}  // namespace fileprompt::app
