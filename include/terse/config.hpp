// ==============================================================================
// terse/config.hpp - Конфигурация terse
// ==============================================================================
//
// Назначение:
// - Итоговые значения настроек, потребляемые роутером и оптимизаторами
// - Загрузка YAML (yaml-cpp) слоями: встроенные значения по умолчанию ->
//   ~/.terse/config.yaml -> ./.terse.yaml -> TERSE_* переменные -> профиль
// - Режимы (hybrid / fast-only / smart-only / passthrough) и профили
//   (fast / balanced / quality)
// - `config show` (to_yaml) и `config init` (аннотированный файл по умолчанию)
//
// Повреждённый файл пропускается с предупреждением и не прерывает вызов.
//
// ==============================================================================

#ifndef TERSE_CONFIG_HPP
#define TERSE_CONFIG_HPP

#include "terse/circuit_breaker.hpp"
#include "terse/optimizer.hpp"
#include "terse/preprocess.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace terse::config {

// ----------------------------------------------------------------------------
// Mode / Profile
// ----------------------------------------------------------------------------

enum class Mode { Hybrid, FastOnly, SmartOnly, Passthrough };

enum class Profile { Fast, Balanced, Quality };

/// "hybrid" / "fast-only" / "smart-only" / "passthrough"
std::string to_string(Mode m);

/// "fast" / "balanced" / "quality"
std::string to_string(Profile p);

/// Разобрать режим ("fast-only", "fast_only", "fastonly", ... без учёта регистра)
/// @throw std::invalid_argument если строка не распознана
Mode parse_mode(std::string_view s);

/// @throw std::invalid_argument если строка не распознана
Profile parse_profile(std::string_view s);

/// "1" / "true" / "yes" / "on" без учёта регистра
bool is_truthy(std::string_view s);

// ----------------------------------------------------------------------------
// Секции
// ----------------------------------------------------------------------------

struct GeneralConfig {
    bool enabled = true;
    Mode mode = Mode::Hybrid;
    Profile profile = Profile::Balanced;
    bool safe_mode = false;  // true: вся оптимизация отключена
    std::uint64_t command_timeout_ms = 600000;
};

struct FastPathConfig {
    bool enabled = true;
};

struct SmartPathConfig {
    bool enabled = false;
    std::string model = "llama3.2:1b";
    std::string url = "http://localhost:11434";
    double temperature = 0.0;
    std::uint64_t cold_start_timeout_ms = 60000;  // модель не загружена
    std::uint64_t warm_timeout_ms = 3000;         // модель уже в памяти
};

struct Thresholds {
    size_t passthrough_below_bytes = 2048;
    size_t smart_path_above_bytes = 10240;
};

struct PreprocessingConfig {
    bool enabled = true;
    preprocess::Options options;
};

struct RouterConfig {
    std::int64_t decision_cache_ttl_secs = 300;
    safety::BreakerSettings breaker;
};

struct AnalyticsConfig {
    bool enabled = true;
    std::string path;  // пусто -> <state_dir>/command-log.jsonl
};

struct Config {
    GeneralConfig general;
    FastPathConfig fast_path;
    SmartPathConfig smart_path;
    Thresholds thresholds;
    PreprocessingConfig preprocessing;
    RouterConfig router;
    std::vector<std::string> passthrough_commands;  // дополнительный deny-list
    AnalyticsConfig analytics;
    optimizer::Settings optimizers;

    /// Оптимизация разрешена вообще (enabled, не safe_mode, не passthrough)
    bool optimization_enabled() const;

    /// Режим допускает Fast / Smart путь
    bool mode_permits_fast() const;
    bool mode_permits_smart() const;
};

/// Применить профиль к порогам и тайм-аутам (balanced ничего не меняет)
void apply_profile(Config& cfg);

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

/// Результат разбора одного YAML-документа
struct ParseResult {
    bool ok = false;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Наложить YAML-документ на cfg (отсутствующие ключи не меняются)
ParseResult merge_yaml(Config& cfg, std::string_view yaml, std::string_view origin = {});

/// Источник переменных окружения (для тестов подменяется)
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

/// Наложить TERSE_* переменные окружения
/// @return предупреждения о нераспознанных значениях (они пропускаются)
std::vector<Error> apply_env(Config& cfg, const EnvLookup& env);

struct LoadOptions {
    std::optional<std::filesystem::path> global_file;   // nullopt -> ~/.terse/config.yaml
    std::optional<std::filesystem::path> project_file;  // nullopt -> ./.terse.yaml
    EnvLookup env;                                      // пусто -> platform::get_env
};

struct LoadResult {
    Config config;
    std::vector<Error> warnings;  // пропущенные файлы и переменные
};

/// Полная загрузка слоями
LoadResult load(const LoadOptions& options = {});

/// ~/.terse/config.yaml
std::optional<std::filesystem::path> global_config_path();

/// ./.terse.yaml
std::filesystem::path project_config_path();

// ----------------------------------------------------------------------------
// Вывод
// ----------------------------------------------------------------------------

/// Итоговая конфигурация в YAML (`terse config show`)
std::string to_yaml(const Config& cfg);

/// Аннотированный файл конфигурации по умолчанию
std::string default_yaml();

struct InitResult {
    bool ok = false;
    std::filesystem::path path;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Записать default_yaml() в path (если файл есть и force == false - ошибка)
InitResult init(const std::filesystem::path& path, bool force = false);

}  // namespace terse::config

#endif  // TERSE_CONFIG_HPP
