// ==============================================================================
// config.cpp - Загрузка и вывод конфигурации (yaml-cpp)
// ==============================================================================

#include "terse/config.hpp"

#include "terse/platform.hpp"
#include "terse/text.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>
#include <system_error>

namespace terse::config {

namespace {

constexpr const char* GLOBAL_CONFIG_NAME = "config.yaml";
constexpr const char* PROJECT_CONFIG_NAME = ".terse.yaml";

// ----------------------------------------------------------------------------
// Чтение значений
// ----------------------------------------------------------------------------

template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
    const YAML::Node value = node[key];
    if (value && !value.IsNull()) {
        out = value.as<T>();
    }
}

void read_list(const YAML::Node& node, const char* key, std::vector<std::string>& out) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return;
    }
    if (!value.IsSequence()) {
        throw YAML::BadConversion(value.Mark());
    }
    out.clear();
    for (const auto& item : value) {
        out.push_back(item.as<std::string>());
    }
}

void read_general(const YAML::Node& n, GeneralConfig& g) {
    read(n, "enabled", g.enabled);
    if (n["mode"]) {
        g.mode = parse_mode(n["mode"].as<std::string>());
    }
    if (n["profile"]) {
        g.profile = parse_profile(n["profile"].as<std::string>());
    }
    read(n, "safe_mode", g.safe_mode);
    read(n, "command_timeout_ms", g.command_timeout_ms);
}

void read_fast_path(const YAML::Node& n, Config& cfg) {
    read(n, "enabled", cfg.fast_path.enabled);
    const YAML::Node opts = n["optimizers"];
    if (opts && opts.IsMap()) {
        read(opts, "git", cfg.optimizers.git.enabled);
        read(opts, "file", cfg.optimizers.file.enabled);
        read(opts, "build", cfg.optimizers.build.enabled);
        read(opts, "docker", cfg.optimizers.docker.enabled);
        read(opts, "generic", cfg.optimizers.generic.enabled);
    }
}

void read_smart_path(const YAML::Node& n, SmartPathConfig& s) {
    read(n, "enabled", s.enabled);
    read(n, "model", s.model);
    read(n, "url", s.url);
    read(n, "temperature", s.temperature);
    read(n, "cold_start_timeout_ms", s.cold_start_timeout_ms);
    read(n, "warm_timeout_ms", s.warm_timeout_ms);
}

void read_preprocessing(const YAML::Node& n, PreprocessingConfig& p) {
    read(n, "enabled", p.enabled);
    read(n, "max_output_bytes", p.options.max_output_bytes);
    read(n, "noise_removal", p.options.noise);
    read(n, "path_filtering", p.options.path_filter);
    read(n, "deduplication", p.options.dedup);
    read(n, "truncation", p.options.truncation);
    read(n, "whitespace_trim", p.options.trim);
    if (n["path_filter_mode"]) {
        p.options.path_filter_mode =
            preprocess::parse_path_filter_mode(n["path_filter_mode"].as<std::string>());
    }
    read_list(n, "extra_boilerplate", p.options.extra_boilerplate);
    read_list(n, "extra_noise_paths", p.options.extra_noise_paths);
}

void read_router(const YAML::Node& n, RouterConfig& r) {
    read(n, "decision_cache_ttl_secs", r.decision_cache_ttl_secs);
    read(n, "circuit_breaker_threshold", r.breaker.threshold);
    read(n, "circuit_breaker_window", r.breaker.window);
    read(n, "circuit_breaker_cooldown_secs", r.breaker.cooldown_secs);
}

void read_optimizers(const YAML::Node& n, optimizer::Settings& s) {
    if (const YAML::Node g = n["git"]; g && g.IsMap()) {
        read(g, "enabled", s.git.enabled);
        read(g, "log_max_entries", s.git.log_max_entries);
        read(g, "log_default_limit", s.git.log_default_limit);
        read(g, "log_line_max_chars", s.git.log_line_max_chars);
        read(g, "diff_max_hunk_lines", s.git.diff_max_hunk_lines);
        read(g, "diff_max_total_lines", s.git.diff_max_total_lines);
        read(g, "branch_max_local", s.git.branch_max_local);
        read(g, "branch_max_remote", s.git.branch_max_remote);
    }
    if (const YAML::Node f = n["file"]; f && f.IsMap()) {
        read(f, "enabled", s.file.enabled);
        read(f, "ls_max_entries", s.file.ls_max_entries);
        read(f, "ls_max_items", s.file.ls_max_items);
        read(f, "find_max_results", s.file.find_max_results);
        read(f, "cat_max_lines", s.file.cat_max_lines);
        read(f, "cat_head_lines", s.file.cat_head_lines);
        read(f, "cat_tail_lines", s.file.cat_tail_lines);
        read(f, "wc_max_lines", s.file.wc_max_lines);
        read(f, "tree_max_lines", s.file.tree_max_lines);
        read_list(f, "tree_noise_dirs", s.file.tree_noise_dirs);
    }
    if (const YAML::Node b = n["build"]; b && b.IsMap()) {
        read(b, "enabled", s.build.enabled);
        read(b, "test_max_failure_lines", s.build.test_max_failure_lines);
        read(b, "test_max_error_lines", s.build.test_max_error_lines);
        read(b, "test_max_warnings", s.build.test_max_warnings);
        read(b, "build_max_error_lines", s.build.build_max_error_lines);
        read(b, "build_max_warnings", s.build.build_max_warnings);
        read(b, "lint_max_issue_lines", s.build.lint_max_issue_lines);
    }
    if (const YAML::Node d = n["docker"]; d && d.IsMap()) {
        read(d, "enabled", s.docker.enabled);
        read(d, "ps_max_rows", s.docker.ps_max_rows);
        read(d, "images_max_rows", s.docker.images_max_rows);
        read(d, "logs_max_tail", s.docker.logs_max_tail);
        read(d, "logs_max_errors", s.docker.logs_max_errors);
        read(d, "inspect_max_lines", s.docker.inspect_max_lines);
        read(d, "compose_max_rows", s.docker.compose_max_rows);
        read(d, "resource_max_rows", s.docker.resource_max_rows);
    }
    if (const YAML::Node g = n["generic"]; g && g.IsMap()) {
        read(g, "enabled", s.generic.enabled);
        read(g, "min_size_bytes", s.generic.min_size_bytes);
        read(g, "max_lines", s.generic.max_lines);
    }
}

ParseResult merge_file(Config& cfg, const std::filesystem::path& path) {
    ParseResult result;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        result.ok = true;
        return result;
    }
    auto content = platform::read_file(path);
    if (!content) {
        result.error = Error{"cannot read config file", platform::path_to_utf8(path)};
        return result;
    }
    return merge_yaml(cfg, *content, platform::path_to_utf8(path));
}

std::optional<std::uint64_t> parse_u64(std::string_view s) {
    s = text::trim(s);
    if (s.empty() || s.size() > 19) {
        return std::nullopt;
    }
    std::uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        v = v * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return v;
}

}  // namespace

// ----------------------------------------------------------------------------
// Mode / Profile
// ----------------------------------------------------------------------------

std::string to_string(Mode m) {
    switch (m) {
    case Mode::Hybrid:
        return "hybrid";
    case Mode::FastOnly:
        return "fast-only";
    case Mode::SmartOnly:
        return "smart-only";
    case Mode::Passthrough:
        return "passthrough";
    }
    return "hybrid";
}

std::string to_string(Profile p) {
    switch (p) {
    case Profile::Fast:
        return "fast";
    case Profile::Balanced:
        return "balanced";
    case Profile::Quality:
        return "quality";
    }
    return "balanced";
}

Mode parse_mode(std::string_view s) {
    const std::string v = text::to_lower(text::trim(s));
    if (v == "hybrid") {
        return Mode::Hybrid;
    }
    if (v == "fast-only" || v == "fast_only" || v == "fastonly") {
        return Mode::FastOnly;
    }
    if (v == "smart-only" || v == "smart_only" || v == "smartonly") {
        return Mode::SmartOnly;
    }
    if (v == "passthrough") {
        return Mode::Passthrough;
    }
    throw std::invalid_argument("unknown mode: " + std::string(s));
}

Profile parse_profile(std::string_view s) {
    const std::string v = text::to_lower(text::trim(s));
    if (v == "fast") {
        return Profile::Fast;
    }
    if (v == "balanced") {
        return Profile::Balanced;
    }
    if (v == "quality") {
        return Profile::Quality;
    }
    throw std::invalid_argument("unknown profile: " + std::string(s));
}

bool is_truthy(std::string_view s) {
    const std::string v = text::to_lower(text::trim(s));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// ----------------------------------------------------------------------------
// Config
// ----------------------------------------------------------------------------

bool Config::optimization_enabled() const {
    return general.enabled && !general.safe_mode && general.mode != Mode::Passthrough;
}

bool Config::mode_permits_fast() const {
    return fast_path.enabled && (general.mode == Mode::Hybrid || general.mode == Mode::FastOnly);
}

bool Config::mode_permits_smart() const {
    return smart_path.enabled &&
           (general.mode == Mode::Hybrid || general.mode == Mode::SmartOnly);
}

void apply_profile(Config& cfg) {
    switch (cfg.general.profile) {
    case Profile::Fast:
        cfg.smart_path.warm_timeout_ms = 1500;
        cfg.thresholds.passthrough_below_bytes = 1024;
        cfg.thresholds.smart_path_above_bytes = 20 * 1024;
        break;
    case Profile::Balanced:
        break;
    case Profile::Quality:
        cfg.smart_path.warm_timeout_ms = 5000;
        cfg.thresholds.passthrough_below_bytes = 512;
        cfg.thresholds.smart_path_above_bytes = 4 * 1024;
        break;
    }
}

std::string Error::format() const {
    std::ostringstream oss;
    oss << "config error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

ParseResult merge_yaml(Config& cfg, std::string_view yaml, std::string_view origin) {
    ParseResult result;
    result.error.path = std::string(origin);

    // Изменения применяются к копии: частично разобранный файл не влияет на cfg
    Config next = cfg;
    try {
        const YAML::Node root = YAML::Load(std::string(yaml));
        if (root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error.message = "top level must be a mapping";
            return result;
        }
        if (const YAML::Node n = root["general"]; n && n.IsMap()) {
            read_general(n, next.general);
        }
        if (const YAML::Node n = root["fast_path"]; n && n.IsMap()) {
            read_fast_path(n, next);
        }
        if (const YAML::Node n = root["smart_path"]; n && n.IsMap()) {
            read_smart_path(n, next.smart_path);
        }
        if (const YAML::Node n = root["thresholds"]; n && n.IsMap()) {
            read(n, "passthrough_below_bytes", next.thresholds.passthrough_below_bytes);
            read(n, "smart_path_above_bytes", next.thresholds.smart_path_above_bytes);
        }
        if (const YAML::Node n = root["preprocessing"]; n && n.IsMap()) {
            read_preprocessing(n, next.preprocessing);
        }
        if (const YAML::Node n = root["router"]; n && n.IsMap()) {
            read_router(n, next.router);
        }
        if (const YAML::Node n = root["passthrough"]; n && n.IsMap()) {
            read_list(n, "commands", next.passthrough_commands);
        }
        if (const YAML::Node n = root["analytics"]; n && n.IsMap()) {
            read(n, "enabled", next.analytics.enabled);
            read(n, "path", next.analytics.path);
        }
        if (const YAML::Node n = root["optimizers"]; n && n.IsMap()) {
            read_optimizers(n, next.optimizers);
        }
    } catch (const YAML::Exception& e) {
        result.error.message = std::string("YAML parse error: ") + e.what();
        return result;
    } catch (const std::invalid_argument& e) {
        result.error.message = e.what();
        return result;
    }

    cfg = std::move(next);
    result.ok = true;
    return result;
}

std::vector<Error> apply_env(Config& cfg, const EnvLookup& env) {
    std::vector<Error> warnings;
    if (auto v = env("TERSE_ENABLED")) {
        cfg.general.enabled = is_truthy(*v);
    }
    if (auto v = env("TERSE_MODE")) {
        try {
            cfg.general.mode = parse_mode(*v);
        } catch (const std::invalid_argument& e) {
            warnings.push_back(Error{e.what(), "TERSE_MODE"});
        }
    }
    if (auto v = env("TERSE_PROFILE")) {
        try {
            cfg.general.profile = parse_profile(*v);
        } catch (const std::invalid_argument& e) {
            warnings.push_back(Error{e.what(), "TERSE_PROFILE"});
        }
    }
    if (auto v = env("TERSE_SAFE_MODE")) {
        cfg.general.safe_mode = is_truthy(*v);
    }
    if (auto v = env("TERSE_SMART_PATH")) {
        cfg.smart_path.enabled = is_truthy(*v);
    }
    if (auto v = env("TERSE_SMART_PATH_MODEL"); v && !v->empty()) {
        cfg.smart_path.model = *v;
    }
    if (auto v = env("TERSE_SMART_PATH_URL"); v && !v->empty()) {
        cfg.smart_path.url = *v;
    }
    if (auto v = env("TERSE_SMART_PATH_TIMEOUT_MS")) {
        if (auto ms = parse_u64(*v)) {
            cfg.smart_path.warm_timeout_ms = *ms;
        } else {
            warnings.push_back(Error{"not a number: " + *v, "TERSE_SMART_PATH_TIMEOUT_MS"});
        }
    }
    return warnings;
}

std::optional<std::filesystem::path> global_config_path() {
    auto dir = platform::state_dir();
    if (!dir) {
        return std::nullopt;
    }
    return *dir / GLOBAL_CONFIG_NAME;
}

std::filesystem::path project_config_path() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return std::filesystem::path(PROJECT_CONFIG_NAME);
    }
    return cwd / PROJECT_CONFIG_NAME;
}

LoadResult load(const LoadOptions& options) {
    LoadResult result;

    std::vector<std::filesystem::path> files;
    if (options.global_file) {
        files.push_back(*options.global_file);
    } else if (auto global = global_config_path()) {
        files.push_back(*global);
    }
    files.push_back(options.project_file ? *options.project_file : project_config_path());

    for (const auto& file : files) {
        if (file.empty()) {
            continue;
        }
        auto parsed = merge_file(result.config, file);
        if (!parsed) {
            result.warnings.push_back(std::move(parsed.error));
        }
    }

    EnvLookup env = options.env;
    if (!env) {
        env = [](const char* name) { return platform::get_env(name); };
    }
    for (auto& warning : apply_env(result.config, env)) {
        result.warnings.push_back(std::move(warning));
    }
    apply_profile(result.config);
    return result;
}

// ----------------------------------------------------------------------------
// Вывод
// ----------------------------------------------------------------------------

std::string to_yaml(const Config& cfg) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "general" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << cfg.general.enabled;
    out << YAML::Key << "mode" << YAML::Value << to_string(cfg.general.mode);
    out << YAML::Key << "profile" << YAML::Value << to_string(cfg.general.profile);
    out << YAML::Key << "safe_mode" << YAML::Value << cfg.general.safe_mode;
    out << YAML::Key << "command_timeout_ms" << YAML::Value << cfg.general.command_timeout_ms;
    out << YAML::EndMap;

    out << YAML::Key << "fast_path" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << cfg.fast_path.enabled;
    out << YAML::Key << "optimizers" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "git" << YAML::Value << cfg.optimizers.git.enabled;
    out << YAML::Key << "file" << YAML::Value << cfg.optimizers.file.enabled;
    out << YAML::Key << "build" << YAML::Value << cfg.optimizers.build.enabled;
    out << YAML::Key << "docker" << YAML::Value << cfg.optimizers.docker.enabled;
    out << YAML::Key << "generic" << YAML::Value << cfg.optimizers.generic.enabled;
    out << YAML::EndMap;
    out << YAML::EndMap;

    out << YAML::Key << "smart_path" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << cfg.smart_path.enabled;
    out << YAML::Key << "model" << YAML::Value << cfg.smart_path.model;
    out << YAML::Key << "url" << YAML::Value << cfg.smart_path.url;
    out << YAML::Key << "temperature" << YAML::Value << cfg.smart_path.temperature;
    out << YAML::Key << "cold_start_timeout_ms" << YAML::Value
        << cfg.smart_path.cold_start_timeout_ms;
    out << YAML::Key << "warm_timeout_ms" << YAML::Value << cfg.smart_path.warm_timeout_ms;
    out << YAML::EndMap;

    out << YAML::Key << "thresholds" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "passthrough_below_bytes" << YAML::Value
        << cfg.thresholds.passthrough_below_bytes;
    out << YAML::Key << "smart_path_above_bytes" << YAML::Value
        << cfg.thresholds.smart_path_above_bytes;
    out << YAML::EndMap;

    const auto& pp = cfg.preprocessing.options;
    out << YAML::Key << "preprocessing" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << cfg.preprocessing.enabled;
    out << YAML::Key << "max_output_bytes" << YAML::Value << pp.max_output_bytes;
    out << YAML::Key << "noise_removal" << YAML::Value << pp.noise;
    out << YAML::Key << "path_filtering" << YAML::Value << pp.path_filter;
    out << YAML::Key << "path_filter_mode" << YAML::Value
        << preprocess::to_string(pp.path_filter_mode);
    out << YAML::Key << "deduplication" << YAML::Value << pp.dedup;
    out << YAML::Key << "truncation" << YAML::Value << pp.truncation;
    out << YAML::Key << "whitespace_trim" << YAML::Value << pp.trim;
    out << YAML::Key << "extra_boilerplate" << YAML::Value << YAML::Flow << pp.extra_boilerplate;
    out << YAML::Key << "extra_noise_paths" << YAML::Value << YAML::Flow << pp.extra_noise_paths;
    out << YAML::EndMap;

    out << YAML::Key << "router" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "decision_cache_ttl_secs" << YAML::Value
        << cfg.router.decision_cache_ttl_secs;
    out << YAML::Key << "circuit_breaker_threshold" << YAML::Value << cfg.router.breaker.threshold;
    out << YAML::Key << "circuit_breaker_window" << YAML::Value << cfg.router.breaker.window;
    out << YAML::Key << "circuit_breaker_cooldown_secs" << YAML::Value
        << cfg.router.breaker.cooldown_secs;
    out << YAML::EndMap;

    out << YAML::Key << "passthrough" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "commands" << YAML::Value << YAML::Flow << cfg.passthrough_commands;
    out << YAML::EndMap;

    out << YAML::Key << "analytics" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << cfg.analytics.enabled;
    out << YAML::Key << "path" << YAML::Value << cfg.analytics.path;
    out << YAML::EndMap;

    const auto& o = cfg.optimizers;
    out << YAML::Key << "optimizers" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "git" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "log_max_entries" << YAML::Value << o.git.log_max_entries;
    out << YAML::Key << "log_default_limit" << YAML::Value << o.git.log_default_limit;
    out << YAML::Key << "log_line_max_chars" << YAML::Value << o.git.log_line_max_chars;
    out << YAML::Key << "diff_max_hunk_lines" << YAML::Value << o.git.diff_max_hunk_lines;
    out << YAML::Key << "diff_max_total_lines" << YAML::Value << o.git.diff_max_total_lines;
    out << YAML::Key << "branch_max_local" << YAML::Value << o.git.branch_max_local;
    out << YAML::Key << "branch_max_remote" << YAML::Value << o.git.branch_max_remote;
    out << YAML::EndMap;
    out << YAML::Key << "file" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "ls_max_entries" << YAML::Value << o.file.ls_max_entries;
    out << YAML::Key << "ls_max_items" << YAML::Value << o.file.ls_max_items;
    out << YAML::Key << "find_max_results" << YAML::Value << o.file.find_max_results;
    out << YAML::Key << "cat_max_lines" << YAML::Value << o.file.cat_max_lines;
    out << YAML::Key << "cat_head_lines" << YAML::Value << o.file.cat_head_lines;
    out << YAML::Key << "cat_tail_lines" << YAML::Value << o.file.cat_tail_lines;
    out << YAML::Key << "wc_max_lines" << YAML::Value << o.file.wc_max_lines;
    out << YAML::Key << "tree_max_lines" << YAML::Value << o.file.tree_max_lines;
    out << YAML::EndMap;
    out << YAML::Key << "build" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "test_max_failure_lines" << YAML::Value << o.build.test_max_failure_lines;
    out << YAML::Key << "test_max_error_lines" << YAML::Value << o.build.test_max_error_lines;
    out << YAML::Key << "test_max_warnings" << YAML::Value << o.build.test_max_warnings;
    out << YAML::Key << "build_max_error_lines" << YAML::Value << o.build.build_max_error_lines;
    out << YAML::Key << "build_max_warnings" << YAML::Value << o.build.build_max_warnings;
    out << YAML::Key << "lint_max_issue_lines" << YAML::Value << o.build.lint_max_issue_lines;
    out << YAML::EndMap;
    out << YAML::Key << "docker" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "ps_max_rows" << YAML::Value << o.docker.ps_max_rows;
    out << YAML::Key << "images_max_rows" << YAML::Value << o.docker.images_max_rows;
    out << YAML::Key << "logs_max_tail" << YAML::Value << o.docker.logs_max_tail;
    out << YAML::Key << "logs_max_errors" << YAML::Value << o.docker.logs_max_errors;
    out << YAML::Key << "inspect_max_lines" << YAML::Value << o.docker.inspect_max_lines;
    out << YAML::Key << "compose_max_rows" << YAML::Value << o.docker.compose_max_rows;
    out << YAML::Key << "resource_max_rows" << YAML::Value << o.docker.resource_max_rows;
    out << YAML::EndMap;
    out << YAML::Key << "generic" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "min_size_bytes" << YAML::Value << o.generic.min_size_bytes;
    out << YAML::Key << "max_lines" << YAML::Value << o.generic.max_lines;
    out << YAML::EndMap;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

std::string default_yaml() {
    return R"(# terse configuration
#
# Layers (later wins):
#   1. built-in defaults
#   2. ~/.terse/config.yaml
#   3. ./.terse.yaml
#   4. TERSE_* environment variables
#   5. profile adjustments

general:
  enabled: true
  mode: hybrid            # hybrid | fast-only | smart-only | passthrough
  profile: balanced       # fast | balanced | quality
  safe_mode: false        # true or TERSE_SAFE_MODE=1 disables all optimization
  command_timeout_ms: 600000

fast_path:
  enabled: true
  optimizers:
    git: true
    file: true
    build: true
    docker: true
    generic: true

smart_path:
  enabled: false          # opt-in: true or TERSE_SMART_PATH=1
  model: "llama3.2:1b"
  url: "http://localhost:11434"
  temperature: 0.0
  cold_start_timeout_ms: 60000
  warm_timeout_ms: 3000

thresholds:
  passthrough_below_bytes: 2048     # smaller outputs are never touched
  smart_path_above_bytes: 10240     # smart path eligible from here

preprocessing:
  enabled: true
  max_output_bytes: 32768
  noise_removal: true
  path_filtering: true
  path_filter_mode: summary         # summary | remove
  deduplication: true
  truncation: true
  whitespace_trim: true
  extra_boilerplate: []
  extra_noise_paths: []

router:
  decision_cache_ttl_secs: 300
  circuit_breaker_threshold: 0.2
  circuit_breaker_window: 10
  circuit_breaker_cooldown_secs: 600

passthrough:
  commands: []            # added to the built-in deny-list

analytics:
  enabled: true
  path: ""                # empty: ~/.terse/command-log.jsonl

optimizers:
  git:
    log_max_entries: 50
    log_default_limit: 20
    log_line_max_chars: 120
    diff_max_hunk_lines: 15
    diff_max_total_lines: 200
    branch_max_local: 20
    branch_max_remote: 10
  file:
    ls_max_entries: 50
    ls_max_items: 60
    find_max_results: 40
    cat_max_lines: 100
    cat_head_lines: 60
    cat_tail_lines: 30
    wc_max_lines: 30
    tree_max_lines: 60
  build:
    test_max_failure_lines: 80
    test_max_error_lines: 40
    test_max_warnings: 10
    build_max_error_lines: 60
    build_max_warnings: 10
    lint_max_issue_lines: 80
  docker:
    ps_max_rows: 30
    images_max_rows: 30
    logs_max_tail: 30
    logs_max_errors: 20
    inspect_max_lines: 60
    compose_max_rows: 30
    resource_max_rows: 30
  generic:
    min_size_bytes: 512
    max_lines: 200
)";
}

InitResult init(const std::filesystem::path& path, bool force) {
    InitResult result;
    result.path = path;
    std::error_code ec;
    if (!force && std::filesystem::exists(path, ec)) {
        result.error = Error{"config file already exists (use --force to overwrite)",
                             platform::path_to_utf8(path)};
        return result;
    }
    if (!platform::write_file_atomic(path, default_yaml())) {
        result.error = Error{"failed to write config file", platform::path_to_utf8(path)};
        return result;
    }
    result.ok = true;
    return result;
}

}  // namespace terse::config
