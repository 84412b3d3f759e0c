// ==============================================================================
// fileprompt/gitignore.hpp - Правила исключения из .gitignore
// ==============================================================================
//
// Назначение:
// - Чтение .gitignore директории (непустые строки, не комментарии)
// - IgnoreRuleSet: накопленный набор правил для поддерева
// - Сопоставление базового имени с правилами (glob)
//
// Правила накапливаются при спуске: набор директории = набор родителя +
// собственный .gitignore. Набор передаётся по значению, поэтому правила
// поддерева никогда не видны соседним поддеревьям.
//
// ==============================================================================

#ifndef FILEPROMPT_GITIGNORE_HPP
#define FILEPROMPT_GITIGNORE_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fileprompt::io {

/// Имя файла правил
constexpr const char* GITIGNORE_FILENAME = ".gitignore";

// ----------------------------------------------------------------------------
// Разбор .gitignore
// ----------------------------------------------------------------------------

/// Разобрать текст .gitignore: trim каждой строки, пропуск пустых и '#'
std::vector<std::string> parse_gitignore(std::string_view text);

/// Прочитать <dir>/.gitignore.
///
/// Отсутствующий файл (или не regular file) даёт пустой список, не ошибка.
/// @throws std::runtime_error если файл есть, но прочитать его не удалось
std::vector<std::string> read_gitignore(const std::filesystem::path& dir);

// ----------------------------------------------------------------------------
// IgnoreRuleSet
// ----------------------------------------------------------------------------

class IgnoreRuleSet {
public:
    IgnoreRuleSet() = default;
    explicit IgnoreRuleSet(std::vector<std::string> rules);

    /// Новый набор: текущие правила + more (текущий набор не меняется)
    IgnoreRuleSet extended(const std::vector<std::string>& more) const;

    /// Совпадает ли базовое имя с каким-либо правилом.
    /// Для директорий дополнительно проверяется "name/".
    bool matches(std::string_view name, bool is_dir) const;

    const std::vector<std::string>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }
    std::size_t size() const { return rules_.size(); }

private:
    std::vector<std::string> rules_;
};

}  // namespace fileprompt::io

#endif  // FILEPROMPT_GITIGNORE_HPP
