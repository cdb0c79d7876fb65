// ==============================================================================
// analytics.cpp - Журналы решений и экономии токенов
// ==============================================================================

#include "terse/analytics.hpp"

#include "terse/command.hpp"
#include "terse/platform.hpp"
#include "terse/text.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <map>
#include <unordered_map>

namespace terse::analytics {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

/// Программы, у которых значима вторая часть команды (подкоманда)
const std::vector<std::string>& multiplexers() {
    static const std::vector<std::string> list = {
        "git",   "docker", "docker-compose", "podman", "kubectl", "helm",  "cargo",
        "npm",   "yarn",   "pnpm",           "go",     "dotnet",  "mvn",   "gradle",
        "pip",   "pip3",   "make",
    };
    return list;
}

void put_string(JsonWriter& w, const char* key, const std::string& value) {
    w.Key(key);
    w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

std::string get_string(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return {};
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::uint64_t get_uint(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsUint64()) {
        return 0;
    }
    return it->value.GetUint64();
}

AppendResult append_json(const std::filesystem::path& file, const std::string& line) {
    AppendResult result;
    if (!platform::append_line(file, line)) {
        result.error = "failed to append to " + platform::path_to_utf8(file);
        return result;
    }
    result.ok = true;
    return result;
}

std::optional<std::filesystem::path> in_state_dir(const char* name) {
    auto dir = platform::state_dir();
    if (!dir) {
        return std::nullopt;
    }
    return *dir / name;
}

}  // namespace

// ----------------------------------------------------------------------------
// Сериализация
// ----------------------------------------------------------------------------

std::string to_json(const CommandRecord& record) {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    put_string(w, "timestamp", record.timestamp);
    put_string(w, "command", record.command);
    put_string(w, "path", record.path);
    put_string(w, "optimizer", record.optimizer);
    w.Key("original_tokens");
    w.Uint64(record.original_tokens);
    w.Key("optimized_tokens");
    w.Uint64(record.optimized_tokens);
    w.Key("savings_pct");
    w.Double(record.savings_pct);
    w.Key("latency_ms");
    w.Uint64(record.latency_ms);
    w.Key("exit_code");
    w.Int(record.exit_code);
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string to_json(const HookEvent& event) {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    w.StartObject();
    put_string(w, "timestamp", event.timestamp);
    put_string(w, "tool_name", event.tool_name);
    if (event.command) {
        put_string(w, "command", *event.command);
    }
    put_string(w, "decision", event.decision);
    if (event.reason) {
        put_string(w, "reason", *event.reason);
    }
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::optional<CommandRecord> parse_command_record(std::string_view line) {
    rapidjson::Document doc;
    doc.Parse(line.data(), line.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }

    CommandRecord r;
    r.timestamp = get_string(doc, "timestamp");
    r.command = get_string(doc, "command");
    r.path = get_string(doc, "path");
    r.optimizer = get_string(doc, "optimizer");
    r.original_tokens = static_cast<size_t>(get_uint(doc, "original_tokens"));
    r.optimized_tokens = static_cast<size_t>(get_uint(doc, "optimized_tokens"));
    r.latency_ms = get_uint(doc, "latency_ms");
    auto savings = doc.FindMember("savings_pct");
    if (savings != doc.MemberEnd() && savings->value.IsNumber()) {
        r.savings_pct = savings->value.GetDouble();
    }
    auto code = doc.FindMember("exit_code");
    if (code != doc.MemberEnd() && code->value.IsInt()) {
        r.exit_code = code->value.GetInt();
    }
    if (r.command.empty()) {
        return std::nullopt;
    }
    return r;
}

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

std::optional<std::filesystem::path> default_command_log_path() {
    return in_state_dir(COMMAND_LOG_FILE);
}

std::optional<std::filesystem::path> default_events_path() {
    return in_state_dir(EVENTS_FILE);
}

AppendResult append(const std::filesystem::path& file, const CommandRecord& record) {
    return append_json(file, to_json(record));
}

AppendResult append(const std::filesystem::path& file, const HookEvent& event) {
    return append_json(file, to_json(event));
}

std::vector<CommandRecord> read_command_log(const std::filesystem::path& file) {
    std::vector<CommandRecord> records;
    auto content = platform::read_file(file);
    if (!content) {
        return records;
    }
    for (auto line : text::split_lines(*content)) {
        if (text::trim(line).empty()) {
            continue;
        }
        if (auto r = parse_command_record(line)) {
            records.push_back(std::move(*r));
        }
    }
    return records;
}

// ----------------------------------------------------------------------------
// Статистика
// ----------------------------------------------------------------------------

std::string base_command(std::string_view command) {
    const std::string core = command::extract_core(command);
    const auto words = text::split_whitespace(core);
    if (words.empty()) {
        return {};
    }
    std::string base = text::to_lower(words[0]);
    const auto& mux = multiplexers();
    if (words.size() > 1 && words[1].front() != '-' &&
        std::find(mux.begin(), mux.end(), base) != mux.end()) {
        base += ' ';
        base += text::to_lower(words[1]);
    }
    return base;
}

Stats compute_stats(const std::vector<CommandRecord>& records) {
    Stats stats;
    stats.total_commands = records.size();

    struct Group {
        CommandStat stat;
        double savings_sum = 0.0;
        std::map<std::string, size_t> optimizers;
    };
    std::unordered_map<std::string, Group> groups;

    for (const auto& r : records) {
        stats.original_tokens += r.original_tokens;
        stats.optimized_tokens += r.optimized_tokens;
        if (r.path == "fast") {
            ++stats.fast;
        } else if (r.path == "smart") {
            ++stats.smart;
        } else {
            ++stats.passthrough;
        }

        const std::string base = base_command(r.command);
        auto& g = groups[base];
        g.stat.command = base;
        ++g.stat.count;
        g.stat.original_tokens += r.original_tokens;
        g.stat.optimized_tokens += r.optimized_tokens;
        g.savings_sum += r.savings_pct;
        ++g.optimizers[r.optimizer];
    }
    stats.savings_pct = text::savings_pct(stats.original_tokens, stats.optimized_tokens);

    for (auto& [name, g] : groups) {
        g.stat.avg_savings_pct = g.savings_sum / static_cast<double>(g.stat.count);
        size_t best = 0;
        for (const auto& [opt, count] : g.optimizers) {
            if (count > best) {
                best = count;
                g.stat.primary_optimizer = opt;
            }
        }
        stats.commands.push_back(std::move(g.stat));
    }

    const auto saved = [](const CommandStat& s) {
        return s.original_tokens > s.optimized_tokens ? s.original_tokens - s.optimized_tokens : 0;
    };
    std::sort(stats.commands.begin(), stats.commands.end(),
              [&](const CommandStat& a, const CommandStat& b) {
                  if (saved(a) != saved(b)) {
                      return saved(a) > saved(b);
                  }
                  return a.command < b.command;
              });
    return stats;
}

}  // namespace terse::analytics
