// ==============================================================================
// test_router_gtest.cpp - Тесты роутера (GoogleTest)
// ==============================================================================
//
// Команды не запускаются: FakeRunner отдает заранее заданный вывод,
// FakeLlm - заранее заданный ответ модели.
//
// ==============================================================================

#include "terse/router.hpp"

#include "terse/category.hpp"
#include "terse/preprocess.hpp"
#include "terse/text.hpp"

#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace terse::router::test {

namespace {

constexpr std::int64_t NOW = 1700000000;

class FakeRunner : public process::CommandRunner {
public:
    process::ProcessOutput run(std::string_view command) override {
        commands.emplace_back(command);
        process::ProcessOutput out;
        out.spawned = spawn;
        if (!spawn) {
            out.exit_code = process::EXIT_SPAWN_FAILURE;
            out.error = "spawn failed";
            return out;
        }
        auto it = outputs.find(std::string(command));
        if (it != outputs.end()) {
            out.stdout_text = it->second;
        }
        out.exit_code = exit_code;
        out.success = exit_code == 0;
        return out;
    }

    std::map<std::string, std::string> outputs;
    std::vector<std::string> commands;
    int exit_code = 0;
    bool spawn = true;
};

class FakeLlm : public llm::LlmClient {
public:
    bool is_healthy() override {
        ++health_calls;
        return healthy;
    }

    llm::ChatResult chat(const std::vector<llm::ChatMessage>& messages) override {
        ++chat_calls;
        last_messages = messages;
        if (throw_on_chat) {
            throw std::runtime_error("malformed UTF-8 in response");
        }
        llm::ChatResult r;
        r.ok = ok;
        r.text = reply;
        r.error = ok ? "" : "connection refused";
        r.latency_ms = 42;
        return r;
    }

    std::string model_name() const override { return "fake-model"; }

    bool healthy = true;
    bool ok = true;
    bool throw_on_chat = false;
    std::string reply;
    int health_calls = 0;
    int chat_calls = 0;
    std::vector<llm::ChatMessage> last_messages;
};

/// Оптимизатор "mytool", всегда возвращающий ошибку
class FailingOptimizer : public optimizer::Optimizer {
public:
    std::string name() const override { return "failing"; }
    bool can_handle(const command::CommandContext& ctx) const override {
        return text::starts_with(ctx.core, "mytool");
    }
    optimizer::OptimizeResult optimize(const command::CommandContext&,
                                       std::string_view) const override {
        return optimizer::OptimizeResult::failure("parse error");
    }
};

/// Оптимизатор "mytool", бросающий исключение из optimize()
class ThrowingOptimizer : public optimizer::Optimizer {
public:
    std::string name() const override { return "throwing"; }
    bool can_handle(const command::CommandContext& ctx) const override {
        return text::starts_with(ctx.core, "mytool");
    }
    optimizer::OptimizeResult optimize(const command::CommandContext&,
                                       std::string_view) const override {
        throw std::length_error("basic_string::_M_create");
    }
};

std::string big_plan_output() {
    std::string out;
    for (int i = 0; i < 300; ++i) {
        out += "  # aws_instance.web_" + std::to_string(i) + " will be created\n";
    }
    return out;
}

/// Окружение роутера: конфигурация, реестр, классификатор, breaker
struct Harness {
    explicit Harness(config::Config c = {})
        : cfg(std::move(c)),
          registry(optimizer::Registry::with_defaults(cfg.optimizers)),
          classifier(cfg.passthrough_commands) {}

    Router router(llm::LlmClient* llm = nullptr) {
        return Router(cfg, registry, classifier, breaker, llm);
    }

    config::Config cfg;
    optimizer::Registry registry;
    safety::Classifier classifier;
    safety::CircuitBreaker breaker;
};

config::Config smart_config() {
    config::Config cfg;
    cfg.smart_path.enabled = true;
    return cfg;
}

}  // namespace

// ==============================================================================
// TST-RT-001: decide_path
// ==============================================================================

TEST(DecidePathTest, Disabled_Passthrough) {
    config::Config cfg;
    cfg.general.enabled = false;
    PathInputs in{50000, true, true, true};
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Passthrough);
}

TEST(DecidePathTest, BelowFloor_Passthrough) {
    config::Config cfg;
    PathInputs in{100, true, true, true};
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Passthrough);
}

TEST(DecidePathTest, OptimizerMatches_Fast) {
    config::Config cfg;
    PathInputs in{4096, true, true, true};
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Fast);
}

TEST(DecidePathTest, FastBreakerOpen_FallsToSmart) {
    auto cfg = smart_config();
    PathInputs in{20000, true, false, true};
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Smart);
}

TEST(DecidePathTest, LargeOutput_HealthyLlm_Smart) {
    auto cfg = smart_config();
    PathInputs in{20000, false, true, true};
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Smart);
    EXPECT_EQ(decide_path(cfg, in, [] { return false; }), OptimizationPath::Passthrough);
}

TEST(DecidePathTest, BetweenFloorAndSmartThreshold_PassthroughWithoutHealthCheck) {
    auto cfg = smart_config();
    int calls = 0;
    PathInputs in{5000, false, true, true};
    EXPECT_EQ(decide_path(cfg, in,
                          [&] {
                              ++calls;
                              return true;
                          }),
              OptimizationPath::Passthrough);
    EXPECT_EQ(calls, 0);
}

TEST(DecidePathTest, SmartDisabled_NeverSmart) {
    config::Config cfg;
    PathInputs in{50000, false, true, true};
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Passthrough);
}

TEST(DecidePathTest, ForcedModes) {
    auto cfg = smart_config();
    PathInputs in{5000, true, true, true};

    cfg.general.mode = config::Mode::FastOnly;
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Fast);
    in.optimizer_matches = false;
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Passthrough);

    cfg.general.mode = config::Mode::SmartOnly;
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Smart);

    cfg.general.mode = config::Mode::Passthrough;
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Passthrough);

    // Принудительный режим не отменяет нижний порог
    cfg.general.mode = config::Mode::SmartOnly;
    in.output_bytes = 10;
    EXPECT_EQ(decide_path(cfg, in, [] { return true; }), OptimizationPath::Passthrough);
}

// ==============================================================================
// TST-RT-002: Кэш решений
// ==============================================================================

TEST(DecisionCacheTest, CommandShape_NormalizesCaseAndSpaces) {
    EXPECT_EQ(command_shape("  Git   STATUS  "), "git status");
    EXPECT_EQ(command_shape(""), "");
}

TEST(DecisionCacheTest, Ttl_Expires) {
    DecisionCache cache(300);
    EXPECT_FALSE(cache.get("git status", NOW).has_value());
    cache.insert("git status", PreDecision::rewrite_to(OptimizationPath::Fast), NOW);
    ASSERT_TRUE(cache.get("git status", NOW + 299).has_value());
    EXPECT_TRUE(cache.get("git status", NOW + 299)->rewrite);
    EXPECT_FALSE(cache.get("git status", NOW + 300).has_value());
    EXPECT_EQ(cache.size(), 1u);
}

TEST(DecisionCacheTest, Describe) {
    EXPECT_EQ(PreDecision::rewrite_to(OptimizationPath::Fast).describe(),
              "rewrite (expected: fast)");
    EXPECT_EQ(PreDecision::passthrough(PassthroughReason::Heredoc).describe(),
              "passthrough (contains heredoc)");
}

// ==============================================================================
// TST-RT-003: decide_pre
// ==============================================================================

TEST(RouterDecideTest, KnownCommand_RewriteFast) {
    Harness h;
    auto router = h.router();
    auto d = router.decide_pre(command::normalize("git status"), NOW);
    EXPECT_TRUE(d.rewrite);
    EXPECT_EQ(d.expected_path, OptimizationPath::Fast);
}

TEST(RouterDecideTest, DenyListed_Passthrough) {
    Harness h;
    auto router = h.router();
    auto d = router.decide_pre(command::normalize("rm -rf build"), NOW);
    EXPECT_FALSE(d.rewrite);
    EXPECT_EQ(d.reason, PassthroughReason::NeverOptimize);
}

TEST(RouterDecideTest, SelfInvocation_LoopGuard) {
    Harness h;
    auto router = h.router();
    auto d = router.decide_pre(command::normalize("terse run \"git status\""), NOW);
    EXPECT_FALSE(d.rewrite);
    EXPECT_EQ(d.reason, PassthroughReason::LoopGuard);
}

TEST(RouterDecideTest, SafeMode_Disabled) {
    config::Config cfg;
    cfg.general.safe_mode = true;
    Harness h(cfg);
    auto router = h.router();
    EXPECT_EQ(router.decide_pre(command::normalize("git status"), NOW).reason,
              PassthroughReason::Disabled);
}

TEST(RouterDecideTest, UnknownCommand_NoPathAvailable) {
    Harness h;
    auto router = h.router();
    auto d = router.decide_pre(command::normalize("terraform plan"), NOW);
    EXPECT_FALSE(d.rewrite);
    EXPECT_EQ(d.reason, PassthroughReason::NoPathAvailable);
}

TEST(RouterDecideTest, UnknownCommand_HealthyLlm_RewriteSmart) {
    Harness h(smart_config());
    FakeLlm llm;
    auto router = h.router(&llm);
    auto d = router.decide_pre(command::normalize("terraform plan"), NOW);
    EXPECT_TRUE(d.rewrite);
    EXPECT_EQ(d.expected_path, OptimizationPath::Smart);
}

TEST(RouterDecideTest, FastBreakerOpen_AllCircuitsBroken) {
    Harness h;
    for (int i = 0; i < 10; ++i) {
        h.breaker.record_failure(safety::PathId::Fast, NOW);
    }
    auto router = h.router();
    auto d = router.decide_pre(command::normalize("git status"), NOW);
    EXPECT_FALSE(d.rewrite);
    EXPECT_EQ(d.reason, PassthroughReason::AllCircuitsBroken);
}

TEST(RouterDecideTest, CachedDecision_ReusedWithinTtl) {
    Harness h;
    auto router = h.router();
    const auto ctx = command::normalize("git status");
    EXPECT_TRUE(router.decide_pre(ctx, NOW).rewrite);

    for (int i = 0; i < 10; ++i) {
        h.breaker.record_failure(safety::PathId::Fast, NOW);
    }
    EXPECT_TRUE(router.decide_pre(ctx, NOW + 10).rewrite);
    EXPECT_FALSE(router.decide_pre(ctx, NOW + 400).rewrite);
    EXPECT_EQ(router.cache().size(), 1u);
}

// ==============================================================================
// TST-RT-004: execute - Fast
// ==============================================================================

TEST(RouterExecuteTest, GitStatus_SubstitutedAndCondensed) {
    Harness h;
    FakeRunner runner;
    runner.outputs["git status --porcelain -b"] = "## main\n M src/a.cpp\n";
    auto router = h.router();

    auto r = router.execute(command::normalize("git status"), runner, NOW);
    EXPECT_EQ(r.path, OptimizationPath::Fast);
    EXPECT_EQ(r.optimizer_name, "git");
    EXPECT_EQ(r.output, "branch: main\nmodified (1): src/a.cpp");
    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0], "git status --porcelain -b");
    EXPECT_EQ(h.breaker.status(safety::PathId::Fast, NOW).recent_total, 1u);
}

TEST(RouterExecuteTest, Substitution_KeepsCdPrefix) {
    Harness h;
    FakeRunner runner;
    auto router = h.router();
    router.execute(command::normalize("cd repo && git status"), runner, NOW);
    ASSERT_FALSE(runner.commands.empty());
    EXPECT_EQ(runner.commands[0], "cd repo && git status --porcelain -b");
}

TEST(RouterExecuteTest, SmallOutput_Passthrough) {
    Harness h;
    FakeRunner runner;
    runner.outputs["echo hi"] = "hi\n";
    auto router = h.router();

    auto r = router.execute(command::normalize("echo hi"), runner, NOW);
    EXPECT_EQ(r.path, OptimizationPath::Passthrough);
    EXPECT_EQ(r.output, "hi\n");
    EXPECT_EQ(r.optimizer_name, "passthrough");
    EXPECT_EQ(r.original_tokens, r.optimized_tokens);
}

TEST(RouterExecuteTest, DenyListed_RunsOriginalUntouched) {
    Harness h;
    FakeRunner runner;
    runner.exit_code = 1;
    auto router = h.router();

    auto r = router.execute(command::normalize("rm -rf build"), runner, NOW);
    EXPECT_EQ(r.path, OptimizationPath::Passthrough);
    EXPECT_EQ(r.exit_code, 1);
    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0], "rm -rf build");
    EXPECT_EQ(h.breaker.status(safety::PathId::Fast, NOW).recent_total, 0u);
}

TEST(RouterExecuteTest, FastBreakerOpen_NoSubstitution) {
    Harness h;
    for (int i = 0; i < 10; ++i) {
        h.breaker.record_failure(safety::PathId::Fast, NOW);
    }
    FakeRunner runner;
    runner.outputs["git status"] = "On branch main\nnothing to commit, working tree clean\n";
    auto router = h.router();

    auto r = router.execute(command::normalize("git status"), runner, NOW);
    EXPECT_EQ(r.path, OptimizationPath::Passthrough);
    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0], "git status");
}

TEST(RouterExecuteTest, OptimizerFailure_RecordedAndPassthrough) {
    config::Config cfg;
    std::vector<std::unique_ptr<optimizer::Optimizer>> opts;
    opts.push_back(std::make_unique<FailingOptimizer>());
    optimizer::Registry registry(std::move(opts));
    safety::Classifier classifier;
    safety::CircuitBreaker breaker;
    Router router(cfg, registry, classifier, breaker);

    FakeRunner runner;
    const std::string raw(4096, 'x');
    runner.outputs["mytool --all"] = raw;

    auto r = router.execute(command::normalize("mytool --all"), runner, NOW);
    EXPECT_EQ(r.path, OptimizationPath::Passthrough);
    EXPECT_EQ(r.output, raw);
    auto st = breaker.status(safety::PathId::Fast, NOW);
    EXPECT_EQ(st.recent_total, 1u);
    EXPECT_EQ(st.recent_failures, 1u);
}

TEST(RouterExecuteTest, OptimizerThrows_RawOutputAndExitCodeKept) {
    config::Config cfg;
    std::vector<std::unique_ptr<optimizer::Optimizer>> opts;
    opts.push_back(std::make_unique<ThrowingOptimizer>());
    optimizer::Registry registry(std::move(opts));
    safety::Classifier classifier;
    safety::CircuitBreaker breaker;
    Router router(cfg, registry, classifier, breaker);

    FakeRunner runner;
    runner.exit_code = 2;
    const std::string raw(4096, 'x');
    runner.outputs["mytool --all"] = raw;

    ExecutionResult r;
    ASSERT_NO_THROW(r = router.execute(command::normalize("mytool --all"), runner, NOW));
    EXPECT_EQ(r.path, OptimizationPath::Passthrough);
    EXPECT_EQ(r.output, raw);
    EXPECT_EQ(r.exit_code, 2);
    EXPECT_EQ(breaker.status(safety::PathId::Fast, NOW).recent_failures, 1u);
}

TEST(RouterExecuteTest, SpawnFailure_Passthrough) {
    Harness h;
    FakeRunner runner;
    runner.spawn = false;
    auto router = h.router();

    auto r = router.execute(command::normalize("terraform plan"), runner, NOW);
    EXPECT_EQ(r.path, OptimizationPath::Passthrough);
    EXPECT_EQ(r.exit_code, process::EXIT_SPAWN_FAILURE);
}

// ==============================================================================
// TST-RT-005: execute - Smart
// ==============================================================================

TEST(RouterExecuteTest, Smart_ValidResponse_Used) {
    Harness h(smart_config());
    FakeRunner runner;
    runner.outputs["terraform plan"] = big_plan_output();
    FakeLlm llm;
    llm.reply = "Here is the condensed output:\n300 aws_instance resources to create";
    auto router = h.router(&llm);

    auto r = router.execute(command::normalize("terraform plan"), runner, NOW);
    EXPECT_EQ(r.path, OptimizationPath::Smart);
    EXPECT_EQ(r.output, "300 aws_instance resources to create");
    EXPECT_EQ(r.optimizer_name, "llm:fake-model");
    EXPECT_EQ(r.latency_ms, 42u);
    EXPECT_LT(r.optimized_tokens, r.original_tokens);
    EXPECT_EQ(llm.chat_calls, 1);
    ASSERT_EQ(llm.last_messages.size(), 2u);
    EXPECT_NE(llm.last_messages[1].content.find("terraform plan"), std::string::npos);
    EXPECT_EQ(h.breaker.status(safety::PathId::Smart, NOW).recent_failures, 0u);
    EXPECT_EQ(h.breaker.status(safety::PathId::Smart, NOW).recent_total, 1u);
}

TEST(RouterExecuteTest, Smart_RejectedResponse_PreprocessedFallback) {
    Harness h(smart_config());
    FakeRunner runner;
    const std::string raw = big_plan_output();
    runner.outputs["terraform plan"] = raw;
    FakeLlm llm;
    llm.reply = "I'm sorry, I cannot summarize this.";
    auto router = h.router(&llm);

    auto r = router.execute(command::normalize("terraform plan"), runner, NOW);
    const auto expected =
        preprocess::run(raw, detect_category("terraform plan"), h.cfg.preprocessing.options);
    EXPECT_EQ(r.path, OptimizationPath::Smart);
    EXPECT_EQ(r.optimizer_name, "preprocessed");
    EXPECT_EQ(r.output, expected.text);
    EXPECT_EQ(h.breaker.status(safety::PathId::Smart, NOW).recent_failures, 1u);
}

TEST(RouterExecuteTest, Smart_ChatError_PreprocessedFallback) {
    Harness h(smart_config());
    FakeRunner runner;
    runner.outputs["terraform plan"] = big_plan_output();
    FakeLlm llm;
    llm.ok = false;
    auto router = h.router(&llm);

    auto r = router.execute(command::normalize("terraform plan"), runner, NOW);
    EXPECT_EQ(r.optimizer_name, "preprocessed");
    EXPECT_FALSE(r.output.empty());
    EXPECT_EQ(h.breaker.status(safety::PathId::Smart, NOW).recent_failures, 1u);
}

TEST(RouterExecuteTest, Smart_ChatThrows_RawOutputKept) {
    Harness h(smart_config());
    FakeRunner runner;
    runner.exit_code = 1;
    const std::string raw = big_plan_output();
    runner.outputs["terraform plan"] = raw;
    FakeLlm llm;
    llm.throw_on_chat = true;
    auto router = h.router(&llm);

    ExecutionResult r;
    ASSERT_NO_THROW(r = router.execute(command::normalize("terraform plan"), runner, NOW));
    EXPECT_EQ(r.path, OptimizationPath::Passthrough);
    EXPECT_EQ(r.output, raw);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(llm.chat_calls, 1);
    EXPECT_EQ(h.breaker.status(safety::PathId::Smart, NOW).recent_failures, 1u);
}

TEST(RouterExecuteTest, Smart_UnhealthyLlm_Passthrough) {
    Harness h(smart_config());
    FakeRunner runner;
    const std::string raw = big_plan_output();
    runner.outputs["terraform plan"] = raw;
    FakeLlm llm;
    llm.healthy = false;
    auto router = h.router(&llm);

    auto r = router.execute(command::normalize("terraform plan"), runner, NOW);
    EXPECT_EQ(r.path, OptimizationPath::Passthrough);
    EXPECT_EQ(r.output, raw);
    EXPECT_EQ(llm.chat_calls, 0);
    EXPECT_EQ(llm.health_calls, 1);
}

TEST(RouterExecuteTest, Smart_OutputBelowSmartThreshold_Passthrough) {
    Harness h(smart_config());
    FakeRunner runner;
    runner.outputs["terraform plan"] = std::string(4000, 'y');
    FakeLlm llm;
    auto router = h.router(&llm);

    auto r = router.execute(command::normalize("terraform plan"), runner, NOW);
    EXPECT_EQ(r.path, OptimizationPath::Passthrough);
    EXPECT_EQ(llm.health_calls, 0);
}

}  // namespace terse::router::test
