// ==============================================================================
// terse/cli.hpp - Разбор командной строки
// ==============================================================================
//
// Назначение:
// - Разбор argv в вариант команды
// - Тексты --help / --version
// - Диагностика ошибок использования (exit code 2)
//
// Команды:
//   terse hook                     PreToolUse hook (JSON stdin -> JSON stdout)
//   terse run "<cmd>"              выполнить и сжать вывод
//   terse check "<cmd>"            показать решения без записи аналитики
//   terse health                   состояние путей и LLM
//   terse stats [--json]           статистика по command-log
//   terse config show|init [--force]
//
// ==============================================================================

#ifndef TERSE_CLI_HPP
#define TERSE_CLI_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace terse::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (повторяемая)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

struct HookCommand {};

/// run - аргументы после `run` склеиваются через пробел
struct RunCommand {
    std::string command;
};

struct CheckCommand {
    std::string command;
};

struct HealthCommand {
    bool json = false;  // --json
};

struct StatsCommand {
    bool json = false;  // --json
};

struct ConfigShowCommand {};

struct ConfigInitCommand {
    bool force = false;  // --force
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<HookCommand, RunCommand, CheckCommand, HealthCommand, StatsCommand,
                             ConfigShowCommand, ConfigInitCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат разбора
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

ParseResult parse(int argc, char** argv);
ParseResult parse(const std::vector<std::string>& args);  // без argv[0]

std::string render_help(const std::optional<std::string>& command = std::nullopt);
std::string render_version();

constexpr const char* VERSION = "0.4.0";
constexpr const char* ABOUT = "Token-saving output optimizer for AI coding assistants";

}  // namespace terse::cli

#endif  // TERSE_CLI_HPP
