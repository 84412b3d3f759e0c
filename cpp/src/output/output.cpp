// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: никаких std::endl, перевод строки пишется явно.
//
// ==============================================================================

#include "fileprompt/output.hpp"

#include "fileprompt/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace fileprompt::output {

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

constexpr const char* PREFIX_WARN = "[!] ";
constexpr const char* PREFIX_ERROR = "[x] ";
constexpr const char* PREFIX_DEBUG = "[*] ";
constexpr const char* PREFIX_TRACE = "[~] ";

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    // Открыть файл вывода, если путь задан; неудачу проверяет вызывающий
    // через has_output_file()
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    if (bytes.empty()) {
        return;
    }

    FILE* f = (s == Stream::Stdout) ? sink() : get_file(s);

    errno = 0;
    size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
    // Ошибки записи диагностики в stderr не отслеживаются
    if (written != bytes.size() && s == Stream::Stdout) {
        record_write_error(errno);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

FILE* Writer::sink() const {
    return output_file_ != nullptr ? output_file_ : stdout;
}

void Writer::record_write_error(int err) {
    if (!write_error_.empty()) {
        return;
    }
    write_error_ = err != 0 ? std::strerror(err) : "write failed";
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
}

void Writer::warn(std::string_view message) {
    write_prefix(PREFIX_WARN, Color::Yellow);
    write_line(Stream::Stderr, message);
}

void Writer::error(std::string_view message) {
    write_prefix(PREFIX_ERROR, Color::Red);
    write_line(Stream::Stderr, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefix(PREFIX_DEBUG, Color::Cyan);
    write_line(Stream::Stderr, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefix(PREFIX_TRACE, Color::Magenta);
    write_line(Stream::Stderr, message);
}

void Writer::flush() {
    // Буферизованная запись обнаруживает ENOSPC/EIO только здесь
    FILE* out = sink();
    errno = 0;
    if (std::fflush(out) != 0 || std::ferror(out) != 0) {
        record_write_error(errno);
    }
    if (out != stdout) {
        std::fflush(stdout);
    }
    std::fflush(stderr);
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    // Windows: использовать _wfopen для Unicode путей
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    std::string path_str = platform::path_to_utf8(path);
    output_file_ = std::fopen(path_str.c_str(), "wb");
#endif

    if (output_file_ == nullptr) {
        output_error_ = std::strerror(errno);
        return false;
    }
    output_error_.clear();
    return true;
}

void Writer::close_output_file() {
    if (output_file_ == nullptr) {
        return;
    }

    errno = 0;
    bool failed = std::fflush(output_file_) != 0 || std::ferror(output_file_) != 0;
    int err = errno;
    if (std::fclose(output_file_) != 0 && !failed) {
        failed = true;
        err = errno;
    }
    output_file_ = nullptr;

    if (failed) {
        record_write_error(err);
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    } else {
        return platform::is_tty_stderr();
    }
}

}  // namespace fileprompt::output
