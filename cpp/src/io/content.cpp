// ==============================================================================
// content.cpp - Чтение текстового содержимого файла
// ==============================================================================

#include "fileprompt/content.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fileprompt::io {

const char* content_error_kind_to_string(ContentErrorKind kind) {
    switch (kind) {
    case ContentErrorKind::NotFound:
        return "NotFound";
    case ContentErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ContentErrorKind::Decode:
        return "UnicodeDecodeError";
    case ContentErrorKind::IoError:
        return "IoError";
    }
    return "Unknown";
}

std::string ContentError::format() const {
    return std::string(content_error_kind_to_string(kind)) + ": " + message;
}

ContentResult read_text_file(const std::filesystem::path& path) {
    ContentResult result;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        result.error.kind = ContentErrorKind::NotFound;
        result.error.message = ec ? ec.message() : "No such file or directory";
        return result;
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        int err = errno;
        result.error.kind =
            (err == EACCES || err == EPERM) ? ContentErrorKind::PermissionDenied
                                            : ContentErrorKind::IoError;
        result.error.message = err != 0 ? std::strerror(err) : "failed to open file";
        return result;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        result.error.kind = ContentErrorKind::IoError;
        result.error.message = "failed to read file";
        return result;
    }

    std::string data = buffer.str();
    if (!is_valid_utf8(data)) {
        result.error.kind = ContentErrorKind::Decode;
        result.error.message = "stream did not contain valid UTF-8";
        return result;
    }

    result.ok = true;
    result.content = std::move(data);
    return result;
}

bool is_valid_utf8(std::string_view data) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());
    const size_t size = data.size();

    size_t i = 0;
    while (i < size) {
        unsigned char c = bytes[i];

        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned int lower = 0x80;
        unsigned int upper = 0xBF;

        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) {
                lower = 0xA0;  // overlong
            } else if (c == 0xED) {
                upper = 0x9F;  // суррогаты U+D800..U+DFFF
            }
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) {
                lower = 0x90;  // overlong
            } else if (c == 0xF4) {
                upper = 0x8F;  // > U+10FFFF
            }
        } else {
            return false;
        }

        if (i + len > size) {
            return false;
        }

        // Второй байт с уточнёнными границами, остальные - 0x80..0xBF
        unsigned char second = bytes[i + 1];
        if (second < lower || second > upper) {
            return false;
        }
        for (size_t k = 2; k < len; ++k) {
            unsigned char cont = bytes[i + k];
            if (cont < 0x80 || cont > 0xBF) {
                return false;
            }
        }

        i += len;
    }

    return true;
}

}  // namespace fileprompt::io
