// ==============================================================================
// main.cpp - Точка входа terse
// ==============================================================================
//
// 1. Разбор argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации, состояния circuit breaker и клиента LLM
// 4. Выполнение подкоманды, код возврата
//
// Для `run` и `hook` stdout принадлежит целевой команде или хосту:
// диагностика уходит в stderr и видна только с -v.
//
// ==============================================================================

#include "terse/analytics.hpp"
#include "terse/circuit_breaker.hpp"
#include "terse/classifier.hpp"
#include "terse/cli.hpp"
#include "terse/command.hpp"
#include "terse/config.hpp"
#include "terse/hook.hpp"
#include "terse/llm.hpp"
#include "terse/optimizer.hpp"
#include "terse/output.hpp"
#include "terse/platform.hpp"
#include "terse/process.hpp"
#include "terse/router.hpp"
#include "terse/text.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

using namespace terse;

std::string format_pct(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", value);
    return buf;
}

std::string pad(std::string s, size_t width) {
    if (s.size() < width) {
        s.append(width - s.size(), ' ');
    }
    return s;
}

// ----------------------------------------------------------------------------
// Окружение выполнения
// ----------------------------------------------------------------------------

/// Загрузить конфигурацию. quiet_warnings: предупреждения только на уровне debug.
config::Config load_config(output::Writer& writer, bool quiet_warnings) {
    auto loaded = config::load();
    for (const auto& w : loaded.warnings) {
        if (quiet_warnings) {
            writer.debug(w.format());
        } else {
            writer.warn(w.format());
        }
    }
    return std::move(loaded.config);
}

llm::ClientOptions client_options(const config::SmartPathConfig& smart) {
    llm::ClientOptions opts;
    opts.url = smart.url;
    opts.model = smart.model;
    opts.temperature = smart.temperature;
    opts.cold_start_timeout_ms = smart.cold_start_timeout_ms;
    opts.warm_timeout_ms = smart.warm_timeout_ms;
    return opts;
}

safety::CircuitBreaker load_breaker(const std::optional<std::filesystem::path>& file,
                                    const safety::BreakerSettings& settings) {
    if (!file) {
        return safety::CircuitBreaker(settings);
    }
    return safety::CircuitBreaker::load(*file, settings);
}

/// Все зависимости роутера на время одного вызова
struct Runtime {
    explicit Runtime(config::Config c)
        : cfg(std::move(c)),
          registry(optimizer::Registry::with_defaults(cfg.optimizers)),
          classifier(cfg.passthrough_commands),
          breaker_path(safety::CircuitBreaker::default_path()),
          breaker(load_breaker(breaker_path, cfg.router.breaker)) {
        if (cfg.smart_path.enabled) {
            client = std::make_unique<llm::OllamaClient>(client_options(cfg.smart_path));
        }
    }

    void save_breaker(output::Writer& writer) const {
        if (!breaker_path) {
            return;
        }
        const auto saved = breaker.save(*breaker_path);
        if (!saved) {
            writer.debug("circuit breaker state not saved: " + saved.error);
        }
    }

    config::Config cfg;
    optimizer::Registry registry;
    safety::Classifier classifier;
    std::optional<std::filesystem::path> breaker_path;
    safety::CircuitBreaker breaker;
    std::unique_ptr<llm::OllamaClient> client;  // nullptr: Smart путь выключен
};

std::optional<std::filesystem::path> command_log_path(const config::Config& cfg) {
    if (!cfg.analytics.path.empty()) {
        return platform::path_from_utf8(cfg.analytics.path);
    }
    return analytics::default_command_log_path();
}

// ----------------------------------------------------------------------------
// hook
// ----------------------------------------------------------------------------

int run_hook(output::Writer& writer) {
    const std::string input((std::istreambuf_iterator<char>(std::cin)),
                            std::istreambuf_iterator<char>());

    Runtime rt(load_config(writer, true));
    router::Router router(rt.cfg, rt.registry, rt.classifier, rt.breaker, rt.client.get(), &writer);

    std::string exe = "terse";
    if (auto path = platform::current_exe()) {
        exe = platform::path_to_utf8(*path);
    }

    const auto outcome = hook::handle(input, router, exe);
    writer.write(output::Stream::Stdout, outcome.response);
    writer.flush();

    if (auto log_path = hook::default_log_path()) {
        for (const auto& line : outcome.log) {
            const auto appended = hook::append_log(*log_path, line);
            if (!appended) {
                writer.debug(appended.error);
                break;
            }
        }
    }
    if (outcome.event) {
        if (auto events = analytics::default_events_path()) {
            const auto appended = analytics::append(*events, *outcome.event);
            if (!appended) {
                writer.debug(appended.error);
            }
        }
    }
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run_run(const cli::RunCommand& cmd, output::Writer& writer) {
    Runtime rt(load_config(writer, true));
    router::Router router(rt.cfg, rt.registry, rt.classifier, rt.breaker, rt.client.get(), &writer);

    const auto ctx = command::normalize(cmd.command);
    writer.trace("core: " + ctx.core);
    process::ShellRunner runner(rt.cfg.general.command_timeout_ms);
    const auto result = router.execute(ctx, runner);

    writer.write(output::Stream::Stdout, result.output);
    if (result.path != router::OptimizationPath::Passthrough && !result.output.empty() &&
        result.output.back() != '\n') {
        writer.write(output::Stream::Stdout, "\n");
    }
    writer.flush();
    if (!result.stderr_text.empty()) {
        writer.write(output::Stream::Stderr, result.stderr_text);
    }

    writer.debug("path=" + router::to_string(result.path) + " optimizer=" +
                 result.optimizer_name + " tokens=" + std::to_string(result.original_tokens) +
                 "->" + std::to_string(result.optimized_tokens));

    rt.save_breaker(writer);

    if (rt.cfg.analytics.enabled) {
        if (auto log_path = command_log_path(rt.cfg)) {
            analytics::CommandRecord record;
            record.timestamp = platform::now_rfc3339();
            record.command = cmd.command;
            record.path = router::to_string(result.path);
            record.optimizer = result.optimizer_name;
            record.original_tokens = result.original_tokens;
            record.optimized_tokens = result.optimized_tokens;
            record.savings_pct = text::savings_pct(result.original_tokens, result.optimized_tokens);
            record.latency_ms = result.latency_ms;
            record.exit_code = result.exit_code;
            const auto appended = analytics::append(*log_path, record);
            if (!appended) {
                writer.debug(appended.error);
            }
        }
    }

    return result.exit_code;
}

// ----------------------------------------------------------------------------
// check
// ----------------------------------------------------------------------------

int run_check(const cli::CheckCommand& cmd, output::Writer& writer) {
    Runtime rt(load_config(writer, false));
    router::Router router(rt.cfg, rt.registry, rt.classifier, rt.breaker, rt.client.get(), &writer);

    const auto ctx = command::normalize(cmd.command);
    const auto decision = router.decide_pre(ctx);
    process::ShellRunner runner(rt.cfg.general.command_timeout_ms);
    const auto result = router.execute(ctx, runner);

    const auto line = [&](const std::string& name, const std::string& value) {
        writer.write_line(output::Stream::Stdout, "  " + pad(name + ":", 16) + value);
    };

    writer.write_line(output::Stream::Stdout, "terse check");
    writer.write_line(output::Stream::Stdout, std::string(50, '='));
    line("Command", cmd.command);
    line("Core", ctx.core);
    line("Category", to_string(detect_category(ctx.core)));
    line("Hook decision", decision.describe());
    line("Path taken", router::to_string(result.path));
    line("Optimizer", result.optimizer_name);
    line("Tokens", std::to_string(result.original_tokens) + " -> " +
                       std::to_string(result.optimized_tokens) + " (" +
                       format_pct(text::savings_pct(result.original_tokens,
                                                    result.optimized_tokens)) +
                       " savings)");
    if (result.latency_ms > 0) {
        line("Latency", std::to_string(result.latency_ms) + " ms");
    }
    line("Exit code", std::to_string(result.exit_code));

    writer.write_line(output::Stream::Stdout, "");
    writer.write_line(output::Stream::Stdout, "--- Output ---");
    writer.write(output::Stream::Stdout, result.output);
    if (!result.stderr_text.empty()) {
        writer.write_line(output::Stream::Stdout, "");
        writer.write_line(output::Stream::Stdout, "--- Stderr ---");
        writer.write(output::Stream::Stdout, result.stderr_text);
    }
    writer.flush();
    return 0;
}

// ----------------------------------------------------------------------------
// health
// ----------------------------------------------------------------------------

int run_health(const cli::HealthCommand& cmd, output::Writer& writer) {
    Runtime rt(load_config(writer, false));
    const auto global = config::global_config_path();
    const bool global_exists = global && std::filesystem::exists(*global);
    const bool project_exists = std::filesystem::exists(config::project_config_path());

    const auto fast = rt.breaker.status(safety::PathId::Fast);
    const auto smart = rt.breaker.status(safety::PathId::Smart);
    const bool llm_ok = rt.client && rt.client->is_healthy();

    size_t log_entries = 0;
    if (auto log_path = command_log_path(rt.cfg)) {
        log_entries = analytics::read_command_log(*log_path).size();
    }

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& a = doc.GetAllocator();
        const auto str = [&](const std::string& s) { return rapidjson::Value(s.c_str(), a); };
        const auto path_json = [&](const safety::PathStatus& st) {
            rapidjson::Value v(rapidjson::kObjectType);
            v.AddMember("allowed", st.allowed, a);
            rapidjson::Value until;
            if (st.open_until) {
                until.SetInt64(*st.open_until);
            }
            v.AddMember("open_until", until, a);
            v.AddMember("recent_failures", static_cast<std::uint64_t>(st.recent_failures), a);
            v.AddMember("recent_total", static_cast<std::uint64_t>(st.recent_total), a);
            return v;
        };
        doc.AddMember("mode", str(config::to_string(rt.cfg.general.mode)), a);
        doc.AddMember("profile", str(config::to_string(rt.cfg.general.profile)), a);
        doc.AddMember("enabled", rt.cfg.optimization_enabled(), a);
        doc.AddMember("global_config", global_exists, a);
        doc.AddMember("project_config", project_exists, a);
        doc.AddMember("fast_path", path_json(fast), a);
        doc.AddMember("smart_path", path_json(smart), a);
        doc.AddMember("smart_path_enabled", rt.cfg.smart_path.enabled, a);
        doc.AddMember("llm_healthy", llm_ok, a);
        doc.AddMember("model", str(rt.cfg.smart_path.model), a);
        doc.AddMember("command_log_entries", static_cast<std::uint64_t>(log_entries), a);
        writer.write_json_pretty(doc);
        return 0;
    }

    const auto item = [&](bool ok, const std::string& name, const std::string& detail) {
        const std::string line = std::string("  ") + (ok ? "[ok] " : "[--] ") + pad(name, 25) +
                                 detail;
        if (ok) {
            writer.green_line(line);
        } else {
            writer.yellow_line(line);
        }
    };
    const auto breaker_detail = [](const safety::PathStatus& st) {
        std::string d = st.allowed ? "closed" : "open";
        d += " (" + std::to_string(st.recent_failures) + "/" + std::to_string(st.recent_total) +
             " recent failures)";
        if (st.open_until && !st.allowed) {
            d += ", retry at " + std::to_string(*st.open_until);
        }
        return d;
    };

    writer.write_line(output::Stream::Stdout, "terse health");
    writer.write_line(output::Stream::Stdout, std::string(40, '='));
    item(global_exists, "Global config",
         global_exists ? platform::path_to_utf8(*global)
                       : "not found (run `terse config init` to create)");
    item(project_exists, "Project config",
         project_exists ? ".terse.yaml found" : "none (optional)");
    item(true, "Mode / Profile",
         config::to_string(rt.cfg.general.mode) + " / " +
             config::to_string(rt.cfg.general.profile));
    if (rt.cfg.general.safe_mode || !rt.cfg.general.enabled) {
        item(false, "Optimization", "disabled");
    }
    item(rt.cfg.smart_path.enabled, "Smart path",
         rt.cfg.smart_path.enabled ? "enabled" : "disabled (set TERSE_SMART_PATH=1 to enable)");
    if (rt.client) {
        item(llm_ok, "LLM", llm_ok ? "reachable at " + rt.client->base_url()
                                   : "not reachable at " + rt.client->base_url());
        item(true, "Model", rt.cfg.smart_path.model);
    }
    item(fast.allowed, "Circuit breaker (fast)", breaker_detail(fast));
    item(smart.allowed, "Circuit breaker (smart)", breaker_detail(smart));
    item(log_entries > 0, "Command log", std::to_string(log_entries) + " entries");
    return 0;
}

// ----------------------------------------------------------------------------
// stats
// ----------------------------------------------------------------------------

int run_stats(const cli::StatsCommand& cmd, output::Writer& writer) {
    const auto cfg = load_config(writer, false);
    std::vector<analytics::CommandRecord> records;
    if (auto log_path = command_log_path(cfg)) {
        records = analytics::read_command_log(*log_path);
    }
    const auto stats = analytics::compute_stats(records);

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& a = doc.GetAllocator();
        doc.AddMember("total_commands", static_cast<std::uint64_t>(stats.total_commands), a);
        doc.AddMember("total_original_tokens", static_cast<std::uint64_t>(stats.original_tokens),
                      a);
        doc.AddMember("total_optimized_tokens",
                      static_cast<std::uint64_t>(stats.optimized_tokens), a);
        doc.AddMember("total_savings_pct", stats.savings_pct, a);
        rapidjson::Value dist(rapidjson::kObjectType);
        dist.AddMember("fast", static_cast<std::uint64_t>(stats.fast), a);
        dist.AddMember("smart", static_cast<std::uint64_t>(stats.smart), a);
        dist.AddMember("passthrough", static_cast<std::uint64_t>(stats.passthrough), a);
        doc.AddMember("path_distribution", dist, a);
        rapidjson::Value commands(rapidjson::kArrayType);
        for (const auto& c : stats.commands) {
            rapidjson::Value v(rapidjson::kObjectType);
            v.AddMember("command", rapidjson::Value(c.command.c_str(), a), a);
            v.AddMember("count", static_cast<std::uint64_t>(c.count), a);
            v.AddMember("total_original_tokens", static_cast<std::uint64_t>(c.original_tokens), a);
            v.AddMember("total_optimized_tokens", static_cast<std::uint64_t>(c.optimized_tokens),
                        a);
            v.AddMember("avg_savings_pct", c.avg_savings_pct, a);
            v.AddMember("primary_optimizer", rapidjson::Value(c.primary_optimizer.c_str(), a), a);
            commands.PushBack(v, a);
        }
        doc.AddMember("commands", commands, a);
        writer.write_json_pretty(doc);
        return 0;
    }

    if (stats.total_commands == 0) {
        writer.info("No data yet. Run some commands through terse to see stats.");
        return 0;
    }

    const auto out = [&](const std::string& s) { writer.write_line(output::Stream::Stdout, s); };
    const size_t saved = stats.original_tokens > stats.optimized_tokens
                             ? stats.original_tokens - stats.optimized_tokens
                             : 0;
    out("terse token savings");
    out(std::string(60, '='));
    out("  Total commands: " + std::to_string(stats.total_commands));
    out("  Tokens saved:   " + std::to_string(saved));
    out("  Avg savings:    " + format_pct(stats.savings_pct));
    out("");
    out("  Paths: fast " + std::to_string(stats.fast) + ", smart " + std::to_string(stats.smart) +
        ", passthrough " + std::to_string(stats.passthrough));
    out("");
    out("  " + pad("Command", 22) + pad("Count", 8) + pad("Saved", 10) + pad("Avg", 9) +
        "Optimizer");
    out("  " + std::string(58, '-'));
    size_t shown = 0;
    for (const auto& c : stats.commands) {
        if (shown++ == 15) {
            break;
        }
        const size_t cmd_saved =
            c.original_tokens > c.optimized_tokens ? c.original_tokens - c.optimized_tokens : 0;
        out("  " + pad(text::truncate_chars(c.command, 20), 22) + pad(std::to_string(c.count), 8) +
            pad(std::to_string(cmd_saved), 10) + pad(format_pct(c.avg_savings_pct), 9) +
            c.primary_optimizer);
    }
    return 0;
}

// ----------------------------------------------------------------------------
// config
// ----------------------------------------------------------------------------

int run_config_show(output::Writer& writer) {
    const auto cfg = load_config(writer, false);
    writer.write(output::Stream::Stdout, config::to_yaml(cfg));
    writer.write(output::Stream::Stdout, "\n");
    return 0;
}

int run_config_init(const cli::ConfigInitCommand& cmd, output::Writer& writer) {
    const auto path = config::global_config_path();
    if (!path) {
        throw std::runtime_error("cannot determine the terse state directory (HOME is not set)");
    }
    const auto result = config::init(*path, cmd.force);
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }
    writer.info("Wrote " + platform::path_to_utf8(result.path));
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::HookCommand>) {
                return run_hook(writer);
            } else if constexpr (std::is_same_v<T, cli::RunCommand>) {
                return run_run(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::CheckCommand>) {
                return run_check(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::HealthCommand>) {
                return run_health(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::StatsCommand>) {
                return run_stats(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::ConfigShowCommand>) {
                return run_config_show(writer);
            } else {
                return run_config_init(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
