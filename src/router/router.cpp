// ==============================================================================
// router.cpp - Выбор пути оптимизации и исполнение команды
// ==============================================================================

#include "terse/router.hpp"

#include "terse/platform.hpp"
#include "terse/preprocess.hpp"
#include "terse/text.hpp"
#include "terse/validation.hpp"

#include <exception>

namespace terse::router {

namespace {

constexpr const char* PREPROCESSED_NAME = "preprocessed";

size_t token_count(const std::string& s) {
    return text::estimate_tokens(s);
}

}  // namespace

// ----------------------------------------------------------------------------
// Пути и причины
// ----------------------------------------------------------------------------

std::string to_string(OptimizationPath path) {
    switch (path) {
    case OptimizationPath::Fast:
        return "fast";
    case OptimizationPath::Smart:
        return "smart";
    case OptimizationPath::Passthrough:
        return "passthrough";
    }
    return "passthrough";
}

std::string to_string(PassthroughReason reason) {
    switch (reason) {
    case PassthroughReason::LoopGuard:
        return "terse invocation (loop guard)";
    case PassthroughReason::Heredoc:
        return "contains heredoc";
    case PassthroughReason::NeverOptimize:
        return "destructive or editor command";
    case PassthroughReason::Redirection:
        return "output redirection";
    case PassthroughReason::Disabled:
        return "optimization disabled";
    case PassthroughReason::NoPathAvailable:
        return "no optimizer or smart path available";
    case PassthroughReason::AllCircuitsBroken:
        return "circuit breaker tripped for all paths";
    case PassthroughReason::OutputTooSmall:
        return "output too small to optimize";
    }
    return "no optimizer or smart path available";
}

PassthroughReason reason_for(safety::NeverReason reason) {
    switch (reason) {
    case safety::NeverReason::LoopGuard:
        return PassthroughReason::LoopGuard;
    case safety::NeverReason::DenyListed:
        return PassthroughReason::NeverOptimize;
    case safety::NeverReason::Redirection:
        return PassthroughReason::Redirection;
    case safety::NeverReason::Heredoc:
        return PassthroughReason::Heredoc;
    }
    return PassthroughReason::NeverOptimize;
}

std::string PreDecision::describe() const {
    if (rewrite) {
        return "rewrite (expected: " + to_string(expected_path) + ")";
    }
    return "passthrough (" + to_string(reason) + ")";
}

// ----------------------------------------------------------------------------
// decide_path
// ----------------------------------------------------------------------------

OptimizationPath decide_path(const config::Config& cfg, const PathInputs& in,
                             const std::function<bool()>& healthy) {
    if (!cfg.optimization_enabled()) {
        return OptimizationPath::Passthrough;
    }
    if (in.output_bytes < cfg.thresholds.passthrough_below_bytes) {
        return OptimizationPath::Passthrough;
    }

    const bool fast_ok = cfg.mode_permits_fast() && in.optimizer_matches && in.fast_allowed;
    const auto smart_ok = [&]() {
        return cfg.mode_permits_smart() && in.smart_allowed && healthy && healthy();
    };

    switch (cfg.general.mode) {
    case config::Mode::FastOnly:
        return fast_ok ? OptimizationPath::Fast : OptimizationPath::Passthrough;
    case config::Mode::SmartOnly:
        return smart_ok() ? OptimizationPath::Smart : OptimizationPath::Passthrough;
    case config::Mode::Passthrough:
        return OptimizationPath::Passthrough;
    case config::Mode::Hybrid:
        break;
    }

    if (fast_ok) {
        return OptimizationPath::Fast;
    }
    if (in.output_bytes >= cfg.thresholds.smart_path_above_bytes && smart_ok()) {
        return OptimizationPath::Smart;
    }
    return OptimizationPath::Passthrough;
}

// ----------------------------------------------------------------------------
// DecisionCache
// ----------------------------------------------------------------------------

std::string command_shape(std::string_view core) {
    std::string out;
    for (auto word : text::split_whitespace(core)) {
        if (!out.empty()) {
            out += ' ';
        }
        out += text::to_lower(word);
    }
    return out;
}

std::optional<PreDecision> DecisionCache::get(const std::string& shape, std::int64_t now) const {
    auto it = entries_.find(shape);
    if (it == entries_.end() || now - it->second.cached_at >= ttl_secs_) {
        return std::nullopt;
    }
    return it->second.decision;
}

void DecisionCache::insert(const std::string& shape, const PreDecision& decision,
                           std::int64_t now) {
    entries_[shape] = Entry{decision, now};
}

// ----------------------------------------------------------------------------
// Router
// ----------------------------------------------------------------------------

Router::Router(const config::Config& cfg, const optimizer::Registry& registry,
               const safety::Classifier& classifier, safety::CircuitBreaker& breaker,
               llm::LlmClient* llm, output::Writer* log)
    : cfg_(cfg),
      registry_(registry),
      classifier_(classifier),
      breaker_(breaker),
      llm_(llm),
      log_(log),
      cache_(cfg.router.decision_cache_ttl_secs) {}

void Router::debug(const std::string& message) const {
    if (log_ != nullptr) {
        log_->debug(message);
    }
}

const optimizer::Optimizer* Router::fast_candidate(const command::CommandContext& ctx) const {
    if (!cfg_.mode_permits_fast()) {
        return nullptr;
    }
    // Универсальный оптимизатор считается совпадением только в режиме fast-only
    if (cfg_.general.mode == config::Mode::FastOnly) {
        return registry_.select(ctx);
    }
    return registry_.select_specialized(ctx);
}

bool Router::smart_available() {
    if (llm_ == nullptr || !cfg_.smart_path.enabled) {
        return false;
    }
    if (!healthy_) {
        healthy_ = llm_->is_healthy();
        debug(std::string("llm health: ") + (*healthy_ ? "ok" : "unavailable"));
    }
    return *healthy_;
}

PreDecision Router::decide_pre(const command::CommandContext& ctx) {
    return decide_pre(ctx, platform::now_unix());
}

PreDecision Router::decide_pre(const command::CommandContext& ctx, std::int64_t now) {
    const std::string shape = command_shape(ctx.original);
    if (auto cached = cache_.get(shape, now)) {
        debug("decision cache hit: " + shape);
        return *cached;
    }

    PreDecision decision;
    const auto cls = classifier_.classify(ctx);
    if (!cls.optimizable) {
        decision = PreDecision::passthrough(reason_for(cls.reason));
    } else if (!cfg_.optimization_enabled()) {
        decision = PreDecision::passthrough(PassthroughReason::Disabled);
    } else {
        const bool fast_closed = breaker_.is_allowed(safety::PathId::Fast, now);
        const bool smart_closed = breaker_.is_allowed(safety::PathId::Smart, now);
        const bool permits_fast = cfg_.mode_permits_fast();
        const bool permits_smart = cfg_.mode_permits_smart();

        if (fast_closed && fast_candidate(ctx) != nullptr) {
            decision = PreDecision::rewrite_to(OptimizationPath::Fast);
        } else if (permits_smart && smart_closed && smart_available()) {
            decision = PreDecision::rewrite_to(OptimizationPath::Smart);
        } else {
            const bool fast_open = permits_fast && !fast_closed;
            const bool smart_open = permits_smart && !smart_closed;
            const bool all_blocked = (fast_open || !permits_fast) && (smart_open || !permits_smart);
            decision = PreDecision::passthrough(all_blocked && (fast_open || smart_open)
                                                    ? PassthroughReason::AllCircuitsBroken
                                                    : PassthroughReason::NoPathAvailable);
        }
    }

    cache_.insert(shape, decision, now);
    return decision;
}

ExecutionResult Router::passthrough(const process::ProcessOutput& raw, size_t tokens) const {
    ExecutionResult r;
    r.output = raw.stdout_text;
    r.stderr_text = raw.stderr_text;
    r.path = OptimizationPath::Passthrough;
    r.original_tokens = tokens;
    r.optimized_tokens = tokens;
    r.exit_code = raw.exit_code;
    return r;
}

optimizer::OptimizeResult Router::run_optimizer(const optimizer::Optimizer& opt,
                                                const command::CommandContext& ctx,
                                                const std::string& text) const {
    try {
        return opt.optimize(ctx, text);
    } catch (const std::exception& e) {
        return optimizer::OptimizeResult::failure(std::string("exception: ") + e.what());
    }
}

std::optional<ExecutionResult> Router::try_substitute(const command::CommandContext& ctx,
                                                      const optimizer::Optimizer& opt,
                                                      process::CommandRunner& runner,
                                                      std::int64_t now) {
    auto sub = opt.substitute(ctx);
    if (!sub) {
        return std::nullopt;
    }

    // Подстановка заменяет ядро внутри исходной строки, префиксы (cd x &&) остаются
    std::string command = ctx.original;
    if (!text::replace_first(command, ctx.core, *sub)) {
        command = *sub;
    }
    debug("substitute: " + command);

    const auto raw = runner.run(command);
    const std::string text = raw.combined();
    if (raw.spawned && !raw.timed_out) {
        const std::uint64_t started = platform::monotonic_ms();
        auto res = run_optimizer(opt, ctx, text);
        if (res) {
            breaker_.record_success(safety::PathId::Fast, now);
            ExecutionResult r;
            r.output = std::move(res.output);
            r.path = OptimizationPath::Fast;
            r.original_tokens = token_count(text);
            r.optimized_tokens = token_count(r.output);
            r.optimizer_name = opt.name();
            r.latency_ms = platform::monotonic_ms() - started;
            r.exit_code = raw.exit_code;
            return r;
        }
        debug(opt.name() + " optimizer failed: " + res.error);
    } else {
        debug("substitute did not complete: " + (raw.error.empty() ? "timeout" : raw.error));
    }

    breaker_.record_failure(safety::PathId::Fast, now);
    const auto original = runner.run(ctx.original);
    return passthrough(original, token_count(original.combined()));
}

ExecutionResult Router::run_smart(const command::CommandContext& ctx,
                                  const process::ProcessOutput& raw, const std::string& text,
                                  std::int64_t now) {
    const Category category = detect_category(ctx.core);

    std::string prepared = text;
    if (cfg_.preprocessing.enabled) {
        auto pre = preprocess::run(text, category, cfg_.preprocessing.options);
        debug("preprocess: " + std::to_string(pre.original_bytes) + " -> " +
              std::to_string(pre.processed_bytes) + " bytes (-" +
              std::to_string(static_cast<int>(pre.reduction_pct())) + "%)");
        prepared = std::move(pre.text);
    }

    ExecutionResult r;
    r.path = OptimizationPath::Smart;
    r.original_tokens = token_count(text);
    r.exit_code = raw.exit_code;

    const auto chat = llm_->chat(llm::build_messages(ctx.core, prepared, category));
    r.latency_ms = chat.latency_ms;

    std::string failure;
    if (!chat) {
        failure = chat.error;
    } else {
        std::string candidate = validation::clean_response(chat.text);
        const auto verdict = validation::validate(prepared, candidate, category);
        if (verdict) {
            breaker_.record_success(safety::PathId::Smart, now);
            r.output = std::move(candidate);
            r.optimized_tokens = token_count(r.output);
            r.optimizer_name = "llm:" + llm_->model_name();
            return r;
        }
        failure = "validation rejected: " + verdict.reason;
    }

    debug("smart path failed: " + failure);
    breaker_.record_failure(safety::PathId::Smart, now);
    r.output = std::move(prepared);
    r.optimized_tokens = token_count(r.output);
    r.optimizer_name = PREPROCESSED_NAME;
    return r;
}

ExecutionResult Router::execute(const command::CommandContext& ctx,
                                process::CommandRunner& runner) {
    return execute(ctx, runner, platform::now_unix());
}

ExecutionResult Router::execute(const command::CommandContext& ctx,
                                process::CommandRunner& runner, std::int64_t now) {
    const auto cls = classifier_.classify(ctx);
    if (!cls.optimizable || !cfg_.optimization_enabled()) {
        debug("run unmodified: " + (cls.optimizable ? to_string(PassthroughReason::Disabled)
                                                    : to_string(reason_for(cls.reason))));
        const auto raw = runner.run(ctx.original);
        return passthrough(raw, token_count(raw.combined()));
    }

    const optimizer::Optimizer* opt = fast_candidate(ctx);
    const bool fast_allowed = breaker_.is_allowed(safety::PathId::Fast, now);
    if (opt != nullptr && fast_allowed) {
        if (auto substituted = try_substitute(ctx, *opt, runner, now)) {
            return *substituted;
        }
    }

    const auto raw = runner.run(ctx.original);
    const std::string text = raw.combined();
    const size_t tokens = token_count(text);
    if (!raw.spawned) {
        return passthrough(raw, tokens);
    }
    if (raw.timed_out) {
        if (opt != nullptr && fast_allowed) {
            breaker_.record_failure(safety::PathId::Fast, now);
        }
        return passthrough(raw, tokens);
    }
    if (text.size() < cfg_.thresholds.passthrough_below_bytes) {
        debug(to_string(PassthroughReason::OutputTooSmall));
        return passthrough(raw, tokens);
    }

    PathInputs in;
    in.output_bytes = text.size();
    in.optimizer_matches = opt != nullptr;
    in.fast_allowed = fast_allowed;
    in.smart_allowed = breaker_.is_allowed(safety::PathId::Smart, now);
    const auto healthy = [this]() { return smart_available(); };

    OptimizationPath path = decide_path(cfg_, in, healthy);
    debug("path: " + to_string(path));

    if (path == OptimizationPath::Fast) {
        const std::uint64_t started = platform::monotonic_ms();
        auto res = run_optimizer(*opt, ctx, text);
        if (res) {
            breaker_.record_success(safety::PathId::Fast, now);
            ExecutionResult r;
            r.output = std::move(res.output);
            r.path = OptimizationPath::Fast;
            r.original_tokens = tokens;
            r.optimized_tokens = token_count(r.output);
            r.optimizer_name = opt->name();
            r.latency_ms = platform::monotonic_ms() - started;
            r.exit_code = raw.exit_code;
            return r;
        }
        debug(opt->name() + " optimizer failed: " + res.error);
        breaker_.record_failure(safety::PathId::Fast, now);

        in.optimizer_matches = false;
        path = decide_path(cfg_, in, healthy);
    }

    if (path == OptimizationPath::Smart) {
        // Команда уже выполнена: любой сбой Smart пути отдаёт её вывод без изменений
        try {
            return run_smart(ctx, raw, text, now);
        } catch (const std::exception& e) {
            debug(std::string("smart path failed: ") + e.what());
            breaker_.record_failure(safety::PathId::Smart, now);
        }
    }

    return passthrough(raw, tokens);
}

}  // namespace terse::router
