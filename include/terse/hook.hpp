// ==============================================================================
// terse/hook.hpp - Протокол PreToolUse hook
// ==============================================================================
//
// Назначение:
// - Разбор запроса хоста: {"tool_name": "Bash", "tool_input": {"command": "..."}}
// - Ответ "{}" (выполнить без изменений) или переписанный вызов:
//     {"hookSpecificOutput":{"hookEventName":"PreToolUse",
//      "permissionDecision":"allow","permissionDecisionReason":"...",
//      "updatedInput":{"command":"\"<exe>\" run \"<escaped>\""}}}
// - Событие для events.jsonl и строки для hook.log
//
// Любая ошибка разбора дает "{}": хост выполняет команду как есть.
//
// ==============================================================================

#ifndef TERSE_HOOK_HPP
#define TERSE_HOOK_HPP

#include "terse/analytics.hpp"
#include "terse/router.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace terse::hook {

constexpr const char* HOOK_LOG_FILE = "hook.log";
constexpr const char* EMPTY_RESPONSE = "{}";

struct HookRequest {
    std::string tool_name;
    std::optional<std::string> command;

    bool is_bash() const;
};

struct ParseResult {
    bool ok = false;
    HookRequest request;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Пустой ввод -> ok с пустым tool_name
ParseResult parse_request(std::string_view json);

/// Экранировать ", \, $ и ` для вставки в аргумент в двойных кавычках
std::string escape_argument(std::string_view command);

/// "\"<exe>\" run \"<escaped>\""
std::string build_rewrite_command(std::string_view exe, std::string_view command);

std::string rewrite_response(std::string_view rewritten, std::string_view reason);

/// Команда в одну строку, не длиннее 200 символов (для hook.log)
std::string summarize_command(std::string_view command);

struct HookOutcome {
    std::string response;                      // JSON для stdout
    std::optional<analytics::HookEvent> event;  // запись для events.jsonl
    std::vector<std::string> log;               // строки для hook.log
};

/// Обработать запрос хоста. Команду не выполняет.
HookOutcome handle(std::string_view input, router::Router& router, std::string_view exe);

std::optional<std::filesystem::path> default_log_path();

/// "<rfc3339> <message>" в hook.log
analytics::AppendResult append_log(const std::filesystem::path& file, std::string_view message);

}  // namespace terse::hook

#endif  // TERSE_HOOK_HPP
