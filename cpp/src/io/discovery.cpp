// ==============================================================================
// discovery.cpp - Обход директорий и фильтрация
// ==============================================================================

#include "fileprompt/discovery.hpp"

#include "fileprompt/platform.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fileprompt::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Элемент директории, прошедший фильтры уровня
struct Entry {
    std::filesystem::path path;
    std::string name;  // базовое имя в UTF-8, ключ сортировки
    bool is_dir = false;
    bool is_file = false;
};

bool matches_ignore_patterns(const std::string& name, const std::vector<std::string>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& pattern) {
        return platform::glob_match(pattern, name);
    });
}

void reject(const RejectVisitor& on_reject, const std::filesystem::path& path,
            RejectReason reason) {
    if (on_reject) {
        on_reject(path, reason);
    }
}

/// Прочитать и отфильтровать элементы одной директории.
/// Фильтры: hidden -> .gitignore -> --ignore (первый отказ прерывает проверку).
std::vector<Entry> list_entries(const std::filesystem::path& dir, const WalkOptions& opt,
                                const IgnoreRuleSet& rules, const RejectVisitor& on_reject) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw std::runtime_error("failed to read directory - " + platform::path_to_utf8(dir) +
                                 ": " + ec.message());
    }

    std::vector<Entry> entries;
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw std::runtime_error("failed to read directory - " + platform::path_to_utf8(dir) +
                                     ": " + ec.message());
        }

        Entry entry;
        entry.path = it->path();
        entry.name = platform::path_to_utf8(entry.path.filename());

        // status() следует по symlink; битые ссылки не являются ни файлом, ни директорией
        std::error_code status_ec;
        std::filesystem::file_status status = it->status(status_ec);
        if (!status_ec) {
            entry.is_dir = std::filesystem::is_directory(status);
            entry.is_file = std::filesystem::is_regular_file(status);
        }

        if (!opt.include_hidden && !entry.name.empty() && entry.name.front() == '.') {
            reject(on_reject, entry.path, RejectReason::Hidden);
            continue;
        }

        if (!opt.ignore_gitignore && rules.matches(entry.name, entry.is_dir)) {
            reject(on_reject, entry.path, RejectReason::Gitignore);
            continue;
        }

        // --ignore-files-only освобождает директории от --ignore
        if (!opt.ignore_patterns.empty() && (!entry.is_dir || !opt.ignore_files_only) &&
            matches_ignore_patterns(entry.name, opt.ignore_patterns)) {
            reject(on_reject, entry.path, RejectReason::IgnorePattern);
            continue;
        }

        entries.push_back(std::move(entry));
    }
    if (ec) {
        throw std::runtime_error("failed to read directory - " + platform::path_to_utf8(dir) +
                                 ": " + ec.message());
    }

    // Порядок перечисления ФС не гарантирован: сортируем по имени побайтово
    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.name < b.name; });

    return entries;
}

void walk_recursive(const std::filesystem::path& dir, const WalkOptions& opt,
                    const IgnoreRuleSet& inherited, const CandidateVisitor& on_candidate,
                    const RejectVisitor& on_reject) {
    // Собственный .gitignore дополняет унаследованный набор; копия живёт
    // только в этом кадре и в кадрах потомков
    IgnoreRuleSet rules =
        opt.ignore_gitignore ? inherited : inherited.extended(read_gitignore(dir));

    for (const auto& entry : list_entries(dir, opt, rules, on_reject)) {
        if (entry.is_dir) {
            walk_recursive(entry.path, opt, rules, on_candidate, on_reject);
        } else if (entry.is_file) {
            if (!matches_extensions(entry.path, opt.extensions)) {
                reject(on_reject, entry.path, RejectReason::Extension);
                continue;
            }
            on_candidate(entry.path);
        }
        // Сокеты, FIFO, битые ссылки и т.п. пропускаются
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

const char* reject_reason_to_string(RejectReason reason) {
    switch (reason) {
    case RejectReason::Hidden:
        return "hidden";
    case RejectReason::Gitignore:
        return "gitignore";
    case RejectReason::IgnorePattern:
        return "ignore pattern";
    case RejectReason::Extension:
        return "extension";
    }
    return "unknown";
}

bool matches_extensions(const std::filesystem::path& file_path,
                        const std::vector<std::string>& extensions) {
    if (extensions.empty()) {
        return true;
    }

    // extension() возвращает расширение с точкой (например ".py") или пустую строку
    std::string ext = platform::path_to_utf8(file_path.extension());
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }

    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

IgnoreRuleSet seed_rules(const std::filesystem::path& input, const WalkOptions& opt) {
    if (opt.ignore_gitignore) {
        return {};
    }

    // "dir/" -> родитель "dir", а не сама "dir"
    std::filesystem::path dir = input.has_filename() ? input : input.parent_path();
    // У корня файловой системы родителя нет
    if (!dir.empty() && dir == dir.root_path()) {
        return {};
    }
    std::filesystem::path parent = dir.parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    return IgnoreRuleSet(read_gitignore(parent));
}

void walk_directory(const std::filesystem::path& root, const WalkOptions& opt,
                    const IgnoreRuleSet& inherited, const CandidateVisitor& on_candidate,
                    const RejectVisitor& on_reject) {
    walk_recursive(root, opt, inherited, on_candidate, on_reject);
}

std::vector<std::filesystem::path> discover_files(const std::filesystem::path& root,
                                                  const WalkOptions& opt,
                                                  const IgnoreRuleSet& inherited) {
    std::vector<std::filesystem::path> result;
    walk_directory(root, opt, inherited,
                   [&result](const std::filesystem::path& path) { result.push_back(path); });
    return result;
}

}  // namespace fileprompt::io
