// ==============================================================================
// terse/router.hpp - Выбор пути оптимизации и исполнение команды
// ==============================================================================
//
// Назначение:
// - decide_pre: решение до запуска команды (переписать вызов или оставить)
// - decide_path: чистая функция выбора пути после запуска
//     1. вывод меньше порога                                -> Passthrough
//     2. специализированный оптимизатор + Fast разрешен     -> Fast
//     3. вывод >= порога Smart + Smart разрешен + LLM жива  -> Smart
//     4. иначе                                              -> Passthrough
//   Принудительный режим (fast-only, smart-only, passthrough) пропускает
//   этот порядок.
// - Executor: запуск команды, подстановка компактного вызова, Fast/Smart,
//   фиксация исходов в circuit breaker
// - DecisionCache: кэш решений по форме команды с TTL
//
// Ни одна ошибка оптимизации не доходит до вызывающего: в худшем случае
// возвращается исходный вывод.
//
// ==============================================================================

#ifndef TERSE_ROUTER_HPP
#define TERSE_ROUTER_HPP

#include "terse/circuit_breaker.hpp"
#include "terse/classifier.hpp"
#include "terse/command.hpp"
#include "terse/config.hpp"
#include "terse/llm.hpp"
#include "terse/optimizer.hpp"
#include "terse/output.hpp"
#include "terse/process.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace terse::router {

// ----------------------------------------------------------------------------
// Пути и причины
// ----------------------------------------------------------------------------

enum class OptimizationPath {
    Fast,
    Smart,
    Passthrough,
};

/// "fast" / "smart" / "passthrough"
std::string to_string(OptimizationPath path);

enum class PassthroughReason {
    LoopGuard,
    Heredoc,
    NeverOptimize,
    Redirection,
    Disabled,
    NoPathAvailable,
    AllCircuitsBroken,
    OutputTooSmall,
};

std::string to_string(PassthroughReason reason);

PassthroughReason reason_for(safety::NeverReason reason);

/// Решение до запуска команды
struct PreDecision {
    bool rewrite = false;
    OptimizationPath expected_path = OptimizationPath::Passthrough;
    PassthroughReason reason = PassthroughReason::NoPathAvailable;  // при !rewrite

    /// "rewrite (expected: fast)" / "passthrough (contains heredoc)"
    std::string describe() const;

    static PreDecision rewrite_to(OptimizationPath path) {
        PreDecision d;
        d.rewrite = true;
        d.expected_path = path;
        return d;
    }
    static PreDecision passthrough(PassthroughReason reason) {
        PreDecision d;
        d.reason = reason;
        return d;
    }
};

// ----------------------------------------------------------------------------
// Выбор пути после запуска (чистая функция)
// ----------------------------------------------------------------------------

struct PathInputs {
    size_t output_bytes = 0;
    bool optimizer_matches = false;  // есть оптимизатор для Fast
    bool fast_allowed = false;       // breaker Fast закрыт
    bool smart_allowed = false;      // breaker Smart закрыт
};

/// healthy вызывается только когда остальные условия Smart выполнены
OptimizationPath decide_path(const config::Config& cfg, const PathInputs& in,
                             const std::function<bool()>& healthy);

// ----------------------------------------------------------------------------
// DecisionCache
// ----------------------------------------------------------------------------

/// Ключ кэша: ядро команды в нижнем регистре со сжатыми пробелами
std::string command_shape(std::string_view core);

class DecisionCache {
public:
    explicit DecisionCache(std::int64_t ttl_secs = 300) : ttl_secs_(ttl_secs) {}

    std::optional<PreDecision> get(const std::string& shape, std::int64_t now) const;
    void insert(const std::string& shape, const PreDecision& decision, std::int64_t now);

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        PreDecision decision;
        std::int64_t cached_at = 0;
    };

    std::int64_t ttl_secs_;
    std::unordered_map<std::string, Entry> entries_;
};

// ----------------------------------------------------------------------------
// Router
// ----------------------------------------------------------------------------

struct ExecutionResult {
    std::string output;       // в stdout
    std::string stderr_text;  // stderr команды при Passthrough
    OptimizationPath path = OptimizationPath::Passthrough;
    size_t original_tokens = 0;
    size_t optimized_tokens = 0;
    std::string optimizer_name = "passthrough";
    std::uint64_t latency_ms = 0;
    int exit_code = 0;
};

class Router {
public:
    /// llm == nullptr: Smart путь недоступен. log == nullptr: без диагностики.
    Router(const config::Config& cfg, const optimizer::Registry& registry,
           const safety::Classifier& classifier, safety::CircuitBreaker& breaker,
           llm::LlmClient* llm = nullptr, output::Writer* log = nullptr);

    /// Решение до запуска. Команду не выполняет.
    PreDecision decide_pre(const command::CommandContext& ctx, std::int64_t now);
    PreDecision decide_pre(const command::CommandContext& ctx);

    /// Выполнить команду через runner и вернуть (оптимизированный) вывод
    ExecutionResult execute(const command::CommandContext& ctx, process::CommandRunner& runner,
                            std::int64_t now);
    ExecutionResult execute(const command::CommandContext& ctx, process::CommandRunner& runner);

    DecisionCache& cache() { return cache_; }

private:
    const optimizer::Optimizer* fast_candidate(const command::CommandContext& ctx) const;
    /// optimize() с перехватом исключений: исключение становится OptimizeResult{ok=false}
    optimizer::OptimizeResult run_optimizer(const optimizer::Optimizer& opt,
                                            const command::CommandContext& ctx,
                                            const std::string& text) const;
    bool smart_available();
    std::optional<ExecutionResult> try_substitute(const command::CommandContext& ctx,
                                                  const optimizer::Optimizer& opt,
                                                  process::CommandRunner& runner,
                                                  std::int64_t now);
    /// Предобработка, LLM, очистка и проверка; при отказе - предобработанный текст
    ExecutionResult run_smart(const command::CommandContext& ctx, const process::ProcessOutput& raw,
                              const std::string& text, std::int64_t now);
    ExecutionResult passthrough(const process::ProcessOutput& raw, size_t tokens) const;
    void debug(const std::string& message) const;

    const config::Config& cfg_;
    const optimizer::Registry& registry_;
    const safety::Classifier& classifier_;
    safety::CircuitBreaker& breaker_;
    llm::LlmClient* llm_;
    output::Writer* log_;
    DecisionCache cache_;
    std::optional<bool> healthy_;  // результат проверки LLM в пределах вызова
};

}  // namespace terse::router

#endif  // TERSE_ROUTER_HPP
