// ==============================================================================
// gitignore.cpp - Правила исключения из .gitignore
// ==============================================================================

#include "fileprompt/gitignore.hpp"

#include "fileprompt/platform.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace fileprompt::io {

namespace {

std::string_view trim(std::string_view str) {
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

}  // namespace

// ----------------------------------------------------------------------------
// Разбор .gitignore
// ----------------------------------------------------------------------------

std::vector<std::string> parse_gitignore(std::string_view text) {
    std::vector<std::string> rules;

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = text.size();
        }

        std::string_view line = trim(text.substr(pos, eol - pos));
        if (!line.empty() && line.front() != '#') {
            rules.emplace_back(line);
        }

        pos = eol + 1;
    }

    return rules;
}

std::vector<std::string> read_gitignore(const std::filesystem::path& dir) {
    std::filesystem::path gitignore_path = dir / GITIGNORE_FILENAME;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(gitignore_path, ec)) {
        return {};
    }

    std::ifstream file(gitignore_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("failed to read gitignore - " +
                                 platform::path_to_utf8(gitignore_path));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("failed to read gitignore - " +
                                 platform::path_to_utf8(gitignore_path));
    }

    return parse_gitignore(buffer.str());
}

// ----------------------------------------------------------------------------
// IgnoreRuleSet
// ----------------------------------------------------------------------------

IgnoreRuleSet::IgnoreRuleSet(std::vector<std::string> rules) : rules_(std::move(rules)) {}

IgnoreRuleSet IgnoreRuleSet::extended(const std::vector<std::string>& more) const {
    IgnoreRuleSet result(rules_);
    result.rules_.insert(result.rules_.end(), more.begin(), more.end());
    return result;
}

bool IgnoreRuleSet::matches(std::string_view name, bool is_dir) const {
    if (rules_.empty()) {
        return false;
    }

    std::string dir_name;
    if (is_dir) {
        dir_name.reserve(name.size() + 1);
        dir_name.append(name);
        dir_name.push_back('/');
    }

    for (const auto& rule : rules_) {
        if (platform::glob_match(rule, name)) {
            return true;
        }
        // Правила вида "build/" рассчитаны на директории
        if (is_dir && platform::glob_match(rule, dir_name)) {
            return true;
        }
    }

    return false;
}

}  // namespace fileprompt::io
