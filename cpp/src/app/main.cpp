// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv через cli
// 2. Создание Writer (output), открытие --output
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются на границе app.
//
// ==============================================================================

#include "fileprompt/cli.hpp"
#include "fileprompt/output.hpp"
#include "fileprompt/platform.hpp"
#include "fileprompt/session.hpp"

#include <exception>
#include <iostream>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// Выполнение основной команды
// ----------------------------------------------------------------------------

int run_concat(const fileprompt::cli::RunCommand& cmd) {
    using namespace fileprompt;

    output::OutputConfig out_cfg;
    out_cfg.verbose = cmd.verbose;
    out_cfg.output_path = cmd.output;
    output::Writer writer(out_cfg);

    // Без файла вывода обработку не начинаем
    if (cmd.output.has_value() && !writer.has_output_file()) {
        writer.error("failed to create output file '" + platform::path_to_utf8(*cmd.output) +
                     "' - " + writer.output_error());
        return 1;
    }

    // Пути из argv, затем из stdin (если это не терминал)
    std::vector<std::filesystem::path> paths = cmd.paths;
    std::vector<std::filesystem::path> stdin_paths = cli::read_stdin_paths(cmd.null_separator);
    paths.insert(paths.end(), stdin_paths.begin(), stdin_paths.end());

    app::Session session(app::session_options_from(cmd), writer);
    session.process(paths);

    // Ошибка записи в приёмник (диск заполнен и т.п.) обнаруживается при сбросе буферов
    writer.close_output_file();
    writer.flush();
    if (writer.has_write_error()) {
        writer.error("failed to write output - " + writer.write_error());
        return 1;
    }

    writer.debug("Done. Documents: " + std::to_string(session.documents_written()) +
                 ", skipped files: " + std::to_string(session.files_skipped()) +
                 ", missing paths: " + std::to_string(session.paths_missing()));
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace fileprompt;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    // Ошибки парсинга: сообщение без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        output::Writer writer(output::OutputConfig{});
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                output::Writer writer(output::OutputConfig{});
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                output::Writer writer(output::OutputConfig{});
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_concat(cmd);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
