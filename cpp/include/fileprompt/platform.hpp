// ==============================================================================
// fileprompt/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для stdin/stdout/stderr
// - Glob-сопоставление имён (fnmatch / PathMatchSpec)
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef FILEPROMPT_PLATFORM_HPP
#define FILEPROMPT_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace fileprompt::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить путь из UTF-8 строки (аргумент командной строки, строка stdin)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Представить путь в UTF-8 для вывода
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdin();
bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Glob
// ----------------------------------------------------------------------------

/// Корректен ли glob-шаблон: каждый `[` закрыт `]`, а `**` занимает
/// целый компонент пути (начало или '/' слева, конец или '/' справа).
bool is_valid_glob(std::string_view pattern);

/// Сопоставить имя с glob-шаблоном.
///
/// POSIX (fnmatch): `*` (любая последовательность, включая '/'), `?`,
/// классы `[abc]`, `[a-z]`, `[!x]`. Ведущая точка специально не обрабатывается:
/// `*` совпадает с ".hidden".
///
/// Windows (PathMatchSpecA): только `*` и `?`, классов в скобках нет,
/// а `;` разделяет несколько шаблонов в одной строке.
///
/// Некорректный шаблон (см. is_valid_glob) заменяется на `*` и совпадает
/// с любым именем.
bool glob_match(std::string_view pattern, std::string_view name);

}  // namespace fileprompt::platform

#endif  // FILEPROMPT_PLATFORM_HPP
