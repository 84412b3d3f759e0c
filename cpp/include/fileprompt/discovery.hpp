// ==============================================================================
// fileprompt/discovery.hpp - Обход директорий и фильтрация
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход директорий в глубину
// - Фильтры в фиксированном порядке: hidden -> .gitignore -> --ignore
// - Фильтрация по расширениям (без точки, case-sensitive)
// - Детерминированный порядок: сортировка по имени на каждом уровне
//
// Обход не материализует список: кандидаты отдаются посетителю сразу,
// в порядке сортировки. discover_files() собирает их в вектор.
//
// ==============================================================================

#ifndef FILEPROMPT_DISCOVERY_HPP
#define FILEPROMPT_DISCOVERY_HPP

#include "fileprompt/gitignore.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fileprompt::io {

// ----------------------------------------------------------------------------
// WalkOptions - параметры обхода
// ----------------------------------------------------------------------------

struct WalkOptions {
    /// Допустимые расширения БЕЗ точки ("py", не ".py"). Пусто = все файлы.
    std::vector<std::string> extensions;

    /// --include-hidden: не отбрасывать имена, начинающиеся с '.'
    bool include_hidden = false;

    /// --ignore-files-only: --ignore не применяется к директориям
    bool ignore_files_only = false;

    /// --ignore-gitignore: не читать .gitignore
    bool ignore_gitignore = false;

    /// --ignore: glob-шаблоны для базового имени
    std::vector<std::string> ignore_patterns;
};

// ----------------------------------------------------------------------------
// Причины отбрасывания (для трассировки)
// ----------------------------------------------------------------------------

enum class RejectReason {
    Hidden,         // имя начинается с '.'
    Gitignore,      // совпало правило .gitignore
    IgnorePattern,  // совпал шаблон --ignore
    Extension       // расширение не в списке -e
};

const char* reject_reason_to_string(RejectReason reason);

using CandidateVisitor = std::function<void(const std::filesystem::path&)>;
using RejectVisitor = std::function<void(const std::filesystem::path&, RejectReason)>;

// ----------------------------------------------------------------------------
// API обхода
// ----------------------------------------------------------------------------

/// Проверить расширение файла по списку (пустой список принимает всё).
/// Файл без расширения имеет пустое расширение.
bool matches_extensions(const std::filesystem::path& file_path,
                        const std::vector<std::string>& extensions);

/// Начальный набор правил для директории-аргумента верхнего уровня:
/// правила .gitignore её родительской директории (текущей, если родителя
/// в пути нет). Пустой набор при ignore_gitignore.
IgnoreRuleSet seed_rules(const std::filesystem::path& input, const WalkOptions& opt);

/// Обойти директорию, отдавая кандидатов посетителю в порядке вывода.
///
/// @param root Директория
/// @param opt Параметры фильтрации
/// @param inherited Правила .gitignore, унаследованные от предков
/// @param on_candidate Вызывается для каждого файла, прошедшего фильтры
/// @param on_reject Необязательный: вызывается для каждого отброшенного элемента
///
/// @throws std::runtime_error если директорию или её .gitignore прочитать нельзя
void walk_directory(const std::filesystem::path& root, const WalkOptions& opt,
                    const IgnoreRuleSet& inherited, const CandidateVisitor& on_candidate,
                    const RejectVisitor& on_reject = {});

/// Собрать всех кандидатов директории в вектор (порядок как у walk_directory)
std::vector<std::filesystem::path> discover_files(const std::filesystem::path& root,
                                                  const WalkOptions& opt,
                                                  const IgnoreRuleSet& inherited = {});

}  // namespace fileprompt::io

#endif  // FILEPROMPT_DISCOVERY_HPP
