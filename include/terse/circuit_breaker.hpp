// ==============================================================================
// terse/circuit_breaker.hpp - Предохранитель путей оптимизации
// ==============================================================================
//
// Назначение:
// - Независимое скользящее окно исходов (успех/неудача) для Fast и Smart
// - Переход Closed -> Open, когда доля неудач в полном окне превышает порог
// - Open -> Closed автоматически по истечении open_until (без пробного вызова)
// - Хранение между запусками в ~/.terse/circuit-breaker.json
//
// Формат файла:
//   {"fast_path":{"results":[true,false,...],"open_until":1700000000|null},
//    "smart_path":{...}}
//
// Ошибка чтения трактуется как Closed (оптимистично), ошибка записи не
// фатальна: save() возвращает SaveResult, вызывающий решает, что с ним делать.
//
// ==============================================================================

#ifndef TERSE_CIRCUIT_BREAKER_HPP
#define TERSE_CIRCUIT_BREAKER_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace terse::safety {

enum class PathId { Fast, Smart };

/// "fast_path" / "smart_path" (ключи файла состояния)
std::string to_string(PathId path);

// ----------------------------------------------------------------------------
// Параметры и состояние
// ----------------------------------------------------------------------------

struct BreakerSettings {
    size_t window = 10;
    double threshold = 0.2;  // открывается при доле неудач > threshold
    std::int64_t cooldown_secs = 600;
};

struct PathState {
    std::deque<bool> results;                // true = успех, старые в начале
    std::optional<std::int64_t> open_until;  // unix seconds
};

struct PathStatus {
    bool allowed = true;
    std::optional<std::int64_t> open_until;
    size_t recent_failures = 0;
    size_t recent_total = 0;
};

struct SaveResult {
    bool ok = false;
    std::string error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// CircuitBreaker
// ----------------------------------------------------------------------------

class CircuitBreaker {
public:
    explicit CircuitBreaker(BreakerSettings settings = {});

    /// Загрузить состояние из файла; при любой ошибке - пустое состояние
    static CircuitBreaker load(const std::filesystem::path& file, BreakerSettings settings = {});

    /// ~/.terse/circuit-breaker.json (nullopt если каталог состояния неизвестен)
    static std::optional<std::filesystem::path> default_path();

    /// Путь доступен: не открыт или open_until уже прошёл
    bool is_allowed(PathId path, std::int64_t now) const;
    bool is_allowed(PathId path) const;

    void record_success(PathId path, std::int64_t now);
    void record_failure(PathId path, std::int64_t now);
    void record(PathId path, bool success, std::int64_t now);
    void record(PathId path, bool success);

    PathStatus status(PathId path, std::int64_t now) const;
    PathStatus status(PathId path) const;

    const PathState& state(PathId path) const;
    PathState& state(PathId path);

    const BreakerSettings& settings() const { return settings_; }

    /// Сериализация в JSON (формат файла состояния)
    std::string to_json() const;

    /// Разобрать JSON; nullopt при синтаксической ошибке
    static std::optional<CircuitBreaker> from_json(std::string_view json,
                                                   BreakerSettings settings = {});

    /// Атомарно записать состояние
    SaveResult save(const std::filesystem::path& file) const;

private:
    BreakerSettings settings_;
    PathState fast_;
    PathState smart_;
};

}  // namespace terse::safety

#endif  // TERSE_CIRCUIT_BREAKER_HPP
