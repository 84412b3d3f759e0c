// ==============================================================================
// fileprompt/render.hpp - Сериализация документов
// ==============================================================================
//
// Назначение:
// - Три формата конверта: default, XML-подобный (--cxml), markdown
// - Нумерация строк (ортогональна формату)
// - Индекс документа для XML: принадлежит Renderer, начинается с 1
//
// Один Renderer = один запуск. Глобального состояния нет.
//
// ==============================================================================

#ifndef FILEPROMPT_RENDER_HPP
#define FILEPROMPT_RENDER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace fileprompt::render {

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

enum class Format {
    Default,  // path / --- / content / ---
    Xml,      // <document index="N"> ... </document>
    Markdown  // path + fenced code block
};

const char* format_to_string(Format format);

/// Выбрать формат по флагам: XML важнее markdown, markdown важнее default
Format select_format(bool cxml, bool markdown);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Пронумеровать строки: "<N, выровнен вправо>  <строка>", строки через '\n'.
/// Ширина = число цифр количества строк. Финальный '\n' не даёт пустой строки,
/// '\r' в конце строки отбрасывается.
std::string add_line_numbers(std::string_view content);

/// Кратчайшая серия '`' (не меньше трёх), не встречающаяся в content
std::string markdown_fence(std::string_view content);

/// Язык для подсветки по расширению без точки; "" если неизвестно
std::string_view language_for_extension(std::string_view ext);

// ----------------------------------------------------------------------------
// Renderer
// ----------------------------------------------------------------------------

class Renderer {
public:
    Renderer(Format format, bool line_numbers);

    /// Отрендерить один документ. Для Xml продвигает индекс документа.
    /// Каждая строка результата завершается '\n'.
    std::string render(const std::filesystem::path& path, std::string_view content);

    /// Открывающая обёртка всего вывода ("<documents>\n" для Xml, иначе "")
    std::string begin_documents() const;

    /// Закрывающая обёртка всего вывода ("</documents>\n" для Xml, иначе "")
    std::string end_documents() const;

    Format format() const { return format_; }
    bool line_numbers() const { return line_numbers_; }

    /// Индекс, который получит следующий XML-документ
    std::size_t next_index() const { return next_index_; }

private:
    std::string render_default(const std::string& source, std::string_view body) const;
    std::string render_xml(const std::string& source, std::string_view body);
    std::string render_markdown(const std::filesystem::path& path, const std::string& source,
                                std::string_view content, std::string_view body) const;

    Format format_;
    bool line_numbers_;
    std::size_t next_index_ = 1;
};

}  // namespace fileprompt::render

#endif  // FILEPROMPT_RENDER_HPP
