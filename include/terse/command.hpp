// ==============================================================================
// terse/command.hpp - Нормализация командной строки
// ==============================================================================
//
// Назначение:
// - Сведение произвольно обёрнутой shell-команды к каноническому "ядру"
//   (core), по которому выполняется всё сопоставление
// - Структурные проверки исходной строки: heredoc, перенаправление вывода
// - Защита от зацикливания: распознавание повторного вызова `terse run`
//
// Снимаемые обёртки (в цикле, не более MAX_UNWRAP_DEPTH итераций):
// - `cd <path> &&` и другие цепочки: берётся последний сегмент `&&` / `;`
// - `NAME=value` присваивания окружения в начале
// - `sh -c '...'` / `bash -c "..."`
// - один уровень скобок подоболочки `( ... )`
// - конвейер: остаётся только сегмент до первого `|`
//
// При несбалансированных кавычках или скобках ядром считается вся исходная
// строка (fail open). Все функции чистые.
//
// ==============================================================================

#ifndef TERSE_COMMAND_HPP
#define TERSE_COMMAND_HPP

#include <string>
#include <string_view>

namespace terse::command {

/// Максимальное число итераций снятия обёрток
constexpr int MAX_UNWRAP_DEPTH = 5;

// ----------------------------------------------------------------------------
// CommandContext
// ----------------------------------------------------------------------------

/// Неизменяемый контекст одной команды.
/// original используется для loop guard и проверок перенаправления,
/// core - для всего сопоставления. core пуст только если original пуст.
struct CommandContext {
    std::string original;
    std::string core;
    bool self_invocation = false;  // original вызывает `terse run`
    bool ambiguous = false;        // кавычки/скобки не сбалансированы, core = original
};

/// Построить контекст из сырой строки команды
CommandContext normalize(std::string_view original);

/// Только ядро команды (normalize(command).core)
std::string extract_core(std::string_view command);

// ----------------------------------------------------------------------------
// Структурные проверки (по исходной строке)
// ----------------------------------------------------------------------------

/// Команда вызывает исполнитель terse (`terse run`, `"/path/terse.exe" run`)
bool is_self_invocation(std::string_view command);

/// Неэкранированный `<<` вне кавычек (heredoc или here-string)
bool contains_heredoc(std::string_view command);

/// Неэкранированный `>` вне кавычек, кроме дублирования дескриптора (`2>&1`)
/// и `<>`
bool has_output_redirect(std::string_view command);

/// Кавычки и скобки сбалансированы
bool is_balanced(std::string_view command);

}  // namespace terse::command

#endif  // TERSE_COMMAND_HPP
