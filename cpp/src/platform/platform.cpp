// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#include "fileprompt/platform.hpp"

#include <cstdio>
#include <string>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#include <shlwapi.h>
#pragma comment(lib, "shlwapi.lib")
#else
#include <fnmatch.h>
#include <unistd.h>
#endif

namespace fileprompt::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: конвертируем UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        // Fallback: просто используем как есть
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdin() {
#ifdef _WIN32
    return _isatty(_fileno(stdin)) != 0;
#else
    return isatty(fileno(stdin)) != 0;
#endif
}

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Glob
// ----------------------------------------------------------------------------

bool is_valid_glob(std::string_view pattern) {
    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];

        if (c == '[') {
            // "[]" и "[!]" в начале класса: ']' - обычный символ класса
            size_t j = i + 1;
            if (j < pattern.size() && pattern[j] == '!') {
                ++j;
            }
            if (j < pattern.size() && pattern[j] == ']') {
                ++j;
            }
            size_t close = pattern.find(']', j);
            if (close == std::string_view::npos) {
                return false;
            }
            i = close + 1;
            continue;
        }

        if (c == '*') {
            size_t run = 1;
            while (i + run < pattern.size() && pattern[i + run] == '*') {
                ++run;
            }
            if (run > 2) {
                return false;
            }
            if (run == 2) {
                bool left_ok = i == 0 || pattern[i - 1] == '/';
                bool right_ok = i + 2 == pattern.size() || pattern[i + 2] == '/';
                if (!left_ok || !right_ok) {
                    return false;
                }
            }
            i += run;
            continue;
        }

        ++i;
    }
    return true;
}

bool glob_match(std::string_view pattern, std::string_view name) {
    // fnmatch/PathMatchSpec требуют NUL-терминированные строки
    std::string pattern_str = is_valid_glob(pattern) ? std::string(pattern) : std::string("*");
    std::string name_str(name);
#ifdef _WIN32
    return PathMatchSpecA(name_str.c_str(), pattern_str.c_str()) != FALSE;
#else
    // Без FNM_PATHNAME и FNM_PERIOD: '*' совпадает с '/' и с ведущей точкой
    return fnmatch(pattern_str.c_str(), name_str.c_str(), 0) == 0;
#endif
}

}  // namespace fileprompt::platform
