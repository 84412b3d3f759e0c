// ==============================================================================
// render.cpp - Сериализация документов
// ==============================================================================

#include "fileprompt/render.hpp"

#include "fileprompt/platform.hpp"

#include <array>
#include <utility>
#include <vector>

namespace fileprompt::render {

namespace {

// Таблица расширение -> язык для markdown
constexpr std::array<std::pair<std::string_view, std::string_view>, 14> EXT_TO_LANG = {{
    {"py", "python"},
    {"c", "c"},
    {"cpp", "cpp"},
    {"java", "java"},
    {"js", "javascript"},
    {"ts", "typescript"},
    {"html", "html"},
    {"css", "css"},
    {"xml", "xml"},
    {"json", "json"},
    {"yaml", "yaml"},
    {"yml", "yaml"},
    {"sh", "bash"},
    {"rb", "ruby"},
}};

constexpr size_t MIN_FENCE = 3;

std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;

    size_t pos = 0;
    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        std::string_view line;
        if (eol == std::string_view::npos) {
            line = content.substr(pos);
            pos = content.size();
        } else {
            line = content.substr(pos, eol - pos);
            pos = eol + 1;
        }
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
    }

    return lines;
}

void append_line(std::string& out, std::string_view line) {
    out.append(line);
    out.push_back('\n');
}

}  // namespace

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

const char* format_to_string(Format format) {
    switch (format) {
    case Format::Default:
        return "default";
    case Format::Xml:
        return "xml";
    case Format::Markdown:
        return "markdown";
    }
    return "unknown";
}

Format select_format(bool cxml, bool markdown) {
    if (cxml) {
        return Format::Xml;
    }
    if (markdown) {
        return Format::Markdown;
    }
    return Format::Default;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string add_line_numbers(std::string_view content) {
    std::vector<std::string_view> lines = split_lines(content);
    const size_t width = std::to_string(lines.size()).size();

    std::string result;
    result.reserve(content.size() + lines.size() * (width + 2));

    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result.push_back('\n');
        }
        std::string number = std::to_string(i + 1);
        result.append(width - number.size(), ' ');
        result.append(number);
        result.append("  ");
        result.append(lines[i]);
    }

    return result;
}

std::string markdown_fence(std::string_view content) {
    std::string fence(MIN_FENCE, '`');
    while (content.find(fence) != std::string_view::npos) {
        fence.push_back('`');
    }
    return fence;
}

std::string_view language_for_extension(std::string_view ext) {
    for (const auto& [extension, language] : EXT_TO_LANG) {
        if (extension == ext) {
            return language;
        }
    }
    return {};
}

// ----------------------------------------------------------------------------
// Renderer
// ----------------------------------------------------------------------------

Renderer::Renderer(Format format, bool line_numbers)
    : format_(format), line_numbers_(line_numbers) {}

std::string Renderer::render(const std::filesystem::path& path, std::string_view content) {
    const std::string source = platform::path_to_utf8(path);

    std::string numbered;
    std::string_view body = content;
    if (line_numbers_) {
        numbered = add_line_numbers(content);
        body = numbered;
    }

    switch (format_) {
    case Format::Xml:
        return render_xml(source, body);
    case Format::Markdown:
        return render_markdown(path, source, content, body);
    case Format::Default:
    default:
        return render_default(source, body);
    }
}

std::string Renderer::render_default(const std::string& source, std::string_view body) const {
    std::string out;
    out.reserve(source.size() + body.size() + 16);
    append_line(out, source);
    append_line(out, "---");
    append_line(out, body);
    append_line(out, "");
    append_line(out, "---");
    return out;
}

std::string Renderer::render_xml(const std::string& source, std::string_view body) {
    const size_t index = next_index_++;

    std::string out;
    out.reserve(source.size() + body.size() + 96);
    append_line(out, "<document index=\"" + std::to_string(index) + "\">");
    append_line(out, "<source>" + source + "</source>");
    append_line(out, "<document_content>");
    append_line(out, body);
    append_line(out, "</document_content>");
    append_line(out, "</document>");
    return out;
}

std::string Renderer::render_markdown(const std::filesystem::path& path, const std::string& source,
                                      std::string_view content, std::string_view body) const {
    std::string ext = platform::path_to_utf8(path.extension());
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }

    // Ограждение подбирается по исходному тексту, до нумерации
    const std::string fence = markdown_fence(content);

    std::string out;
    out.reserve(source.size() + body.size() + 2 * fence.size() + 16);
    append_line(out, source);
    std::string opening = fence;
    opening.append(language_for_extension(ext));
    append_line(out, opening);
    append_line(out, body);
    append_line(out, fence);
    return out;
}

std::string Renderer::begin_documents() const {
    return format_ == Format::Xml ? "<documents>\n" : "";
}

std::string Renderer::end_documents() const {
    return format_ == Format::Xml ? "</documents>\n" : "";
}

}  // namespace fileprompt::render
