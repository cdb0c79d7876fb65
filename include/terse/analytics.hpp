// ==============================================================================
// terse/analytics.hpp - Журналы решений и экономии токенов
// ==============================================================================
//
// Назначение:
// - command-log.jsonl: одна запись на каждый `terse run`
// - events.jsonl: одна запись на каждое решение hook
// - Сводная статистика по command-log (`terse stats`)
//
// Формат записей (одна JSON-строка на запись):
//   {"timestamp","command","path","optimizer","original_tokens",
//    "optimized_tokens","savings_pct","latency_ms","exit_code"}
//   {"timestamp","tool_name","command","decision","reason"}
//
// Запись выполняется одним write() с O_APPEND. Ошибки записи возвращаются
// как AppendResult и не прерывают вызов.
//
// ==============================================================================

#ifndef TERSE_ANALYTICS_HPP
#define TERSE_ANALYTICS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace terse::analytics {

constexpr const char* COMMAND_LOG_FILE = "command-log.jsonl";
constexpr const char* EVENTS_FILE = "events.jsonl";

struct CommandRecord {
    std::string timestamp;  // RFC 3339
    std::string command;
    std::string path;       // fast / smart / passthrough
    std::string optimizer;
    size_t original_tokens = 0;
    size_t optimized_tokens = 0;
    double savings_pct = 0.0;
    std::uint64_t latency_ms = 0;
    int exit_code = 0;
};

struct HookEvent {
    std::string timestamp;
    std::string tool_name;
    std::optional<std::string> command;
    std::string decision;  // rewrite / passthrough
    std::optional<std::string> reason;
};

struct AppendResult {
    bool ok = false;
    std::string error;

    explicit operator bool() const { return ok; }
};

std::string to_json(const CommandRecord& record);
std::string to_json(const HookEvent& event);

/// Разобрать строку command-log; nullopt для неверной строки
std::optional<CommandRecord> parse_command_record(std::string_view line);

std::optional<std::filesystem::path> default_command_log_path();
std::optional<std::filesystem::path> default_events_path();

AppendResult append(const std::filesystem::path& file, const CommandRecord& record);
AppendResult append(const std::filesystem::path& file, const HookEvent& event);

/// Все читаемые записи файла (неверные строки пропускаются)
std::vector<CommandRecord> read_command_log(const std::filesystem::path& file);

// ----------------------------------------------------------------------------
// Статистика
// ----------------------------------------------------------------------------

struct CommandStat {
    std::string command;  // базовая команда ("git status", "ls")
    size_t count = 0;
    size_t original_tokens = 0;
    size_t optimized_tokens = 0;
    double avg_savings_pct = 0.0;
    std::string primary_optimizer;
};

struct Stats {
    size_t total_commands = 0;
    size_t original_tokens = 0;
    size_t optimized_tokens = 0;
    double savings_pct = 0.0;
    size_t fast = 0;
    size_t smart = 0;
    size_t passthrough = 0;
    std::vector<CommandStat> commands;  // по убыванию сэкономленных токенов
};

/// "git status -s" -> "git status", "ls -la" -> "ls"
std::string base_command(std::string_view command);

Stats compute_stats(const std::vector<CommandRecord>& records);

}  // namespace terse::analytics

#endif  // TERSE_ANALYTICS_HPP
