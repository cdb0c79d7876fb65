// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации (GoogleTest)
// ==============================================================================
//
// TST-CFG-001..TST-CFG-005
//
// ==============================================================================

#include "terse/config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <string>

namespace terse::config::test {

namespace {

EnvLookup env_from(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

void write(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

}  // namespace

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("terse_cfg_test_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    LoadOptions options(std::map<std::string, std::string> env = {}) const {
        LoadOptions o;
        o.global_file = dir_ / "config.yaml";
        o.project_file = dir_ / ".terse.yaml";
        o.env = env_from(std::move(env));
        return o;
    }

    std::filesystem::path dir_;
};

// ==============================================================================
// TST-CFG-001: Режимы и профили
// ==============================================================================

TEST(ConfigTest, ParseMode_Variants) {
    EXPECT_EQ(parse_mode("hybrid"), Mode::Hybrid);
    EXPECT_EQ(parse_mode("fast-only"), Mode::FastOnly);
    EXPECT_EQ(parse_mode("Fast_Only"), Mode::FastOnly);
    EXPECT_EQ(parse_mode("smartonly"), Mode::SmartOnly);
    EXPECT_EQ(parse_mode(" PASSTHROUGH "), Mode::Passthrough);
    EXPECT_THROW(parse_mode("turbo"), std::invalid_argument);
}

TEST(ConfigTest, ParseProfile_Variants) {
    EXPECT_EQ(parse_profile("fast"), Profile::Fast);
    EXPECT_EQ(parse_profile("Balanced"), Profile::Balanced);
    EXPECT_EQ(parse_profile("quality"), Profile::Quality);
    EXPECT_THROW(parse_profile("max"), std::invalid_argument);
}

TEST(ConfigTest, ToString_RoundTripsThroughParse) {
    for (Mode m : {Mode::Hybrid, Mode::FastOnly, Mode::SmartOnly, Mode::Passthrough}) {
        EXPECT_EQ(parse_mode(to_string(m)), m);
    }
    for (Profile p : {Profile::Fast, Profile::Balanced, Profile::Quality}) {
        EXPECT_EQ(parse_profile(to_string(p)), p);
    }
}

TEST(ConfigTest, IsTruthy) {
    EXPECT_TRUE(is_truthy("1"));
    EXPECT_TRUE(is_truthy("TRUE"));
    EXPECT_TRUE(is_truthy("yes"));
    EXPECT_TRUE(is_truthy("On"));
    EXPECT_FALSE(is_truthy("0"));
    EXPECT_FALSE(is_truthy(""));
    EXPECT_FALSE(is_truthy("nope"));
}

TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_TRUE(cfg.general.enabled);
    EXPECT_EQ(cfg.general.mode, Mode::Hybrid);
    EXPECT_FALSE(cfg.smart_path.enabled);
    EXPECT_EQ(cfg.smart_path.model, "llama3.2:1b");
    EXPECT_EQ(cfg.thresholds.passthrough_below_bytes, 2048u);
    EXPECT_EQ(cfg.thresholds.smart_path_above_bytes, 10240u);
    EXPECT_TRUE(cfg.optimization_enabled());
    EXPECT_TRUE(cfg.mode_permits_fast());
    EXPECT_FALSE(cfg.mode_permits_smart());
}

TEST(ConfigTest, ModePermits) {
    Config cfg;
    cfg.smart_path.enabled = true;
    cfg.general.mode = Mode::FastOnly;
    EXPECT_TRUE(cfg.mode_permits_fast());
    EXPECT_FALSE(cfg.mode_permits_smart());
    cfg.general.mode = Mode::SmartOnly;
    EXPECT_FALSE(cfg.mode_permits_fast());
    EXPECT_TRUE(cfg.mode_permits_smart());
    cfg.general.mode = Mode::Passthrough;
    EXPECT_FALSE(cfg.optimization_enabled());
    cfg.general.mode = Mode::Hybrid;
    cfg.general.safe_mode = true;
    EXPECT_FALSE(cfg.optimization_enabled());
}

TEST(ConfigTest, ApplyProfile) {
    Config fast;
    fast.general.profile = Profile::Fast;
    apply_profile(fast);
    EXPECT_EQ(fast.thresholds.passthrough_below_bytes, 1024u);
    EXPECT_EQ(fast.thresholds.smart_path_above_bytes, 20u * 1024);
    EXPECT_EQ(fast.smart_path.warm_timeout_ms, 1500u);

    Config quality;
    quality.general.profile = Profile::Quality;
    apply_profile(quality);
    EXPECT_EQ(quality.thresholds.passthrough_below_bytes, 512u);
    EXPECT_EQ(quality.smart_path.warm_timeout_ms, 5000u);

    Config balanced;
    apply_profile(balanced);
    EXPECT_EQ(balanced.thresholds.passthrough_below_bytes, 2048u);
}

// ==============================================================================
// TST-CFG-002: merge_yaml
// ==============================================================================

TEST(ConfigTest, MergeYaml_OverridesOnlyPresentKeys) {
    Config cfg;
    auto r = merge_yaml(cfg, R"(
general:
  mode: fast-only
smart_path:
  enabled: true
  model: "qwen2.5:0.5b"
thresholds:
  passthrough_below_bytes: 100
passthrough:
  commands: [terraform, kubectl]
optimizers:
  git:
    log_max_entries: 5
  generic:
    enabled: false
)");
    ASSERT_TRUE(r) << r.error.format();
    EXPECT_EQ(cfg.general.mode, Mode::FastOnly);
    EXPECT_TRUE(cfg.general.enabled);
    EXPECT_TRUE(cfg.smart_path.enabled);
    EXPECT_EQ(cfg.smart_path.model, "qwen2.5:0.5b");
    EXPECT_EQ(cfg.smart_path.url, "http://localhost:11434");
    EXPECT_EQ(cfg.thresholds.passthrough_below_bytes, 100u);
    EXPECT_EQ(cfg.thresholds.smart_path_above_bytes, 10240u);
    ASSERT_EQ(cfg.passthrough_commands.size(), 2u);
    EXPECT_EQ(cfg.passthrough_commands[1], "kubectl");
    EXPECT_EQ(cfg.optimizers.git.log_max_entries, 5u);
    EXPECT_FALSE(cfg.optimizers.generic.enabled);
}

TEST(ConfigTest, MergeYaml_EmptyDocument_NoChange) {
    Config cfg;
    EXPECT_TRUE(merge_yaml(cfg, ""));
    EXPECT_EQ(cfg.general.mode, Mode::Hybrid);
}

TEST(ConfigTest, MergeYaml_InvalidDocument_LeavesConfigUntouched) {
    Config cfg;
    auto r = merge_yaml(cfg, "general:\n  mode: fast-only\n  enabled: [oops\n", "bad.yaml");
    EXPECT_FALSE(r);
    EXPECT_EQ(r.error.path, "bad.yaml");
    EXPECT_EQ(cfg.general.mode, Mode::Hybrid);
}

TEST(ConfigTest, MergeYaml_UnknownMode_Fails) {
    Config cfg;
    auto r = merge_yaml(cfg, "general:\n  mode: turbo\n");
    EXPECT_FALSE(r);
    EXPECT_NE(r.error.message.find("turbo"), std::string::npos);
}

TEST(ConfigTest, MergeYaml_TopLevelScalar_Fails) {
    Config cfg;
    EXPECT_FALSE(merge_yaml(cfg, "just a string"));
}

TEST(ConfigTest, ErrorFormat) {
    Error e{"boom", "/tmp/x.yaml"};
    EXPECT_EQ(e.format(), "config error [/tmp/x.yaml]: boom");
    EXPECT_EQ((Error{"boom", ""}.format()), "config error: boom");
}

// ==============================================================================
// TST-CFG-003: Переменные окружения
// ==============================================================================

TEST(ConfigTest, ApplyEnv_Overrides) {
    Config cfg;
    auto warnings = apply_env(cfg, env_from({{"TERSE_MODE", "smart-only"},
                                             {"TERSE_SMART_PATH", "1"},
                                             {"TERSE_SMART_PATH_MODEL", "phi3"},
                                             {"TERSE_SMART_PATH_URL", "http://gpu:11434"},
                                             {"TERSE_SMART_PATH_TIMEOUT_MS", "2500"},
                                             {"TERSE_SAFE_MODE", "yes"}}));
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(cfg.general.mode, Mode::SmartOnly);
    EXPECT_TRUE(cfg.smart_path.enabled);
    EXPECT_EQ(cfg.smart_path.model, "phi3");
    EXPECT_EQ(cfg.smart_path.url, "http://gpu:11434");
    EXPECT_EQ(cfg.smart_path.warm_timeout_ms, 2500u);
    EXPECT_TRUE(cfg.general.safe_mode);
}

TEST(ConfigTest, ApplyEnv_InvalidValues_Warn) {
    Config cfg;
    auto warnings = apply_env(cfg, env_from({{"TERSE_MODE", "warp"},
                                             {"TERSE_SMART_PATH_TIMEOUT_MS", "soon"}}));
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].path, "TERSE_MODE");
    EXPECT_EQ(warnings[1].path, "TERSE_SMART_PATH_TIMEOUT_MS");
    EXPECT_EQ(cfg.general.mode, Mode::Hybrid);
    EXPECT_EQ(cfg.smart_path.warm_timeout_ms, 3000u);
}

TEST(ConfigTest, ApplyEnv_Disable) {
    Config cfg;
    apply_env(cfg, env_from({{"TERSE_ENABLED", "0"}}));
    EXPECT_FALSE(cfg.general.enabled);
    EXPECT_FALSE(cfg.optimization_enabled());
}

// ==============================================================================
// TST-CFG-004: Загрузка слоями
// ==============================================================================

TEST_F(ConfigFileTest, Load_NoFiles_Defaults) {
    auto r = load(options());
    EXPECT_TRUE(r.warnings.empty());
    EXPECT_EQ(r.config.general.mode, Mode::Hybrid);
}

TEST_F(ConfigFileTest, Load_ProjectOverridesGlobal_EnvOverridesBoth) {
    write(dir_ / "config.yaml", "general:\n  mode: fast-only\nsmart_path:\n  model: a\n");
    write(dir_ / ".terse.yaml", "smart_path:\n  model: b\n");
    auto r = load(options({{"TERSE_MODE", "hybrid"}}));
    EXPECT_TRUE(r.warnings.empty());
    EXPECT_EQ(r.config.smart_path.model, "b");
    EXPECT_EQ(r.config.general.mode, Mode::Hybrid);
}

TEST_F(ConfigFileTest, Load_CorruptFile_SkippedWithWarning) {
    write(dir_ / "config.yaml", "general: [broken\n");
    write(dir_ / ".terse.yaml", "thresholds:\n  passthrough_below_bytes: 10\n");
    auto r = load(options());
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_NE(r.warnings[0].path.find("config.yaml"), std::string::npos);
    EXPECT_EQ(r.config.thresholds.passthrough_below_bytes, 10u);
}

TEST_F(ConfigFileTest, Load_ProfileAppliedLast) {
    write(dir_ / ".terse.yaml", "general:\n  profile: quality\n");
    auto r = load(options());
    EXPECT_EQ(r.config.thresholds.smart_path_above_bytes, 4u * 1024);
}

// ==============================================================================
// TST-CFG-005: Вывод и init
// ==============================================================================

TEST(ConfigTest, DefaultYaml_ParsesToDefaults) {
    Config cfg;
    cfg.general.mode = Mode::Passthrough;
    ASSERT_TRUE(merge_yaml(cfg, default_yaml()));
    Config defaults;
    EXPECT_EQ(cfg.general.mode, defaults.general.mode);
    EXPECT_EQ(cfg.smart_path.model, defaults.smart_path.model);
    EXPECT_EQ(cfg.thresholds.smart_path_above_bytes, defaults.thresholds.smart_path_above_bytes);
    EXPECT_EQ(cfg.router.breaker.window, defaults.router.breaker.window);
}

TEST(ConfigTest, ToYaml_ReflectsValues) {
    Config cfg;
    cfg.general.mode = Mode::FastOnly;
    cfg.passthrough_commands = {"terraform"};
    const std::string yaml = to_yaml(cfg);
    EXPECT_NE(yaml.find("mode: fast-only"), std::string::npos);
    EXPECT_NE(yaml.find("terraform"), std::string::npos);

    Config back;
    ASSERT_TRUE(merge_yaml(back, yaml));
    EXPECT_EQ(back.general.mode, Mode::FastOnly);
    ASSERT_EQ(back.passthrough_commands.size(), 1u);
}

TEST_F(ConfigFileTest, Init_CreatesAndRefusesOverwrite) {
    const auto path = dir_ / "nested" / "config.yaml";
    auto first = init(path);
    ASSERT_TRUE(first) << first.error.format();
    EXPECT_TRUE(std::filesystem::exists(path));

    auto second = init(path);
    EXPECT_FALSE(second);
    EXPECT_NE(second.error.message.find("already exists"), std::string::npos);

    EXPECT_TRUE(init(path, true));
}

}  // namespace terse::config::test
