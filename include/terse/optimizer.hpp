// ==============================================================================
// terse/optimizer.hpp - Протокол оптимизаторов и реестр
// ==============================================================================
//
// Назначение:
// - Интерфейс Optimizer: name / can_handle / substitute / optimize
// - Упорядоченный реестр, выбор первого подходящего оптимизатора
// - Конкретные оптимизаторы: git, file, build, docker, generic
//
// Две стратегии:
// - подстановка (substitute): вместо исходной команды выполняется более
//   экономная по выводу (`git status` -> `git status --porcelain -b`)
// - преобразование (optimize): исходная команда выполняется без изменений,
//   сжимается захваченный вывод
//
// Реестр всегда заканчивается ровно одним универсальным оптимизатором
// (generic), поэтому select() никогда не возвращает nullptr.
//
// Ошибки: optimize() возвращает OptimizeResult{ok=false}, исключения наружу
// не выходят.
//
// ==============================================================================

#ifndef TERSE_OPTIMIZER_HPP
#define TERSE_OPTIMIZER_HPP

#include "terse/command.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace terse::optimizer {

// ----------------------------------------------------------------------------
// Лимиты (значения по умолчанию совпадают с конфигурацией по умолчанию)
// ----------------------------------------------------------------------------

struct GitLimits {
    bool enabled = true;
    size_t log_max_entries = 50;
    size_t log_default_limit = 20;
    size_t log_line_max_chars = 120;
    size_t diff_max_hunk_lines = 15;
    size_t diff_max_total_lines = 200;
    size_t branch_max_local = 20;
    size_t branch_max_remote = 10;
};

struct FileLimits {
    bool enabled = true;
    size_t ls_max_entries = 50;
    size_t ls_max_items = 60;
    size_t find_max_results = 40;
    size_t cat_max_lines = 100;
    size_t cat_head_lines = 60;
    size_t cat_tail_lines = 30;
    size_t wc_max_lines = 30;
    size_t tree_max_lines = 60;
    std::vector<std::string> tree_noise_dirs;  // пусто -> default_tree_noise_dirs()
};

struct BuildLimits {
    bool enabled = true;
    size_t test_max_failure_lines = 80;
    size_t test_max_error_lines = 40;
    size_t test_max_warnings = 10;
    size_t build_max_error_lines = 60;
    size_t build_max_warnings = 10;
    size_t lint_max_issue_lines = 80;
};

struct DockerLimits {
    bool enabled = true;
    size_t ps_max_rows = 30;
    size_t images_max_rows = 30;
    size_t logs_max_tail = 30;
    size_t logs_max_errors = 20;
    size_t inspect_max_lines = 60;
    size_t compose_max_rows = 30;
    size_t resource_max_rows = 30;
};

struct GenericLimits {
    bool enabled = true;
    size_t min_size_bytes = 512;
    size_t max_lines = 200;
};

struct Settings {
    GitLimits git;
    FileLimits file;
    BuildLimits build;
    DockerLimits docker;
    GenericLimits generic;
};

const std::vector<std::string>& default_tree_noise_dirs();

// ----------------------------------------------------------------------------
// Результат
// ----------------------------------------------------------------------------

struct OptimizeResult {
    bool ok = false;
    std::string output;
    std::string error;

    explicit operator bool() const { return ok; }

    static OptimizeResult success(std::string out) {
        OptimizeResult r;
        r.ok = true;
        r.output = std::move(out);
        return r;
    }
    static OptimizeResult failure(std::string message) {
        OptimizeResult r;
        r.error = std::move(message);
        return r;
    }
};

// ----------------------------------------------------------------------------
// Optimizer
// ----------------------------------------------------------------------------

class Optimizer {
public:
    virtual ~Optimizer() = default;

    virtual std::string name() const = 0;

    /// Оптимизатор распознаёт ядро команды
    virtual bool can_handle(const command::CommandContext& ctx) const = 0;

    /// Более экономная замена ядра; nullopt - выполнять исходную команду
    virtual std::optional<std::string> substitute(const command::CommandContext& ctx) const {
        (void)ctx;
        return std::nullopt;
    }

    /// Сжать вывод (исходной команды или подстановки)
    virtual OptimizeResult optimize(const command::CommandContext& ctx,
                                    std::string_view raw) const = 0;

    /// Универсальный оптимизатор, совпадает с любой командой
    virtual bool is_fallback() const { return false; }
};

// ----------------------------------------------------------------------------
// Конкретные оптимизаторы
// ----------------------------------------------------------------------------

/// Эталонный оптимизатор: status, log, diff, branch, show, stash, worktree,
/// push/pull/fetch/add/commit
class GitOptimizer : public Optimizer {
public:
    explicit GitOptimizer(GitLimits limits = {});

    std::string name() const override { return "git"; }
    bool can_handle(const command::CommandContext& ctx) const override;
    std::optional<std::string> substitute(const command::CommandContext& ctx) const override;
    OptimizeResult optimize(const command::CommandContext& ctx,
                            std::string_view raw) const override;

private:
    GitLimits limits_;
};

/// ls / dir / Get-ChildItem, find, cat / head / tail / type, wc, tree
class FileOptimizer : public Optimizer {
public:
    explicit FileOptimizer(FileLimits limits = {});

    std::string name() const override { return "file"; }
    bool can_handle(const command::CommandContext& ctx) const override;
    OptimizeResult optimize(const command::CommandContext& ctx,
                            std::string_view raw) const override;

private:
    FileLimits limits_;
};

/// Тесты, сборка и линтеры (cargo, npm, pytest, go, dotnet, make, ...)
class BuildOptimizer : public Optimizer {
public:
    enum class Kind { Test, Build, Lint };

    explicit BuildOptimizer(BuildLimits limits = {});

    std::string name() const override { return "build"; }
    bool can_handle(const command::CommandContext& ctx) const override;
    OptimizeResult optimize(const command::CommandContext& ctx,
                            std::string_view raw) const override;

    /// Вид команды по ядру; nullopt - не сборочная команда
    static std::optional<Kind> classify(std::string_view core);

private:
    BuildLimits limits_;
};

/// docker ps / images / logs / compose ps / inspect / build / pull / push /
/// network ls / volume ls
class DockerOptimizer : public Optimizer {
public:
    explicit DockerOptimizer(DockerLimits limits = {});

    std::string name() const override { return "docker"; }
    bool can_handle(const command::CommandContext& ctx) const override;
    OptimizeResult optimize(const command::CommandContext& ctx,
                            std::string_view raw) const override;

private:
    DockerLimits limits_;
};

/// Очистка пробелов и ограничение числа строк (голова + хвост)
class GenericOptimizer : public Optimizer {
public:
    explicit GenericOptimizer(GenericLimits limits = {});

    std::string name() const override { return "generic"; }
    bool can_handle(const command::CommandContext& ctx) const override;
    OptimizeResult optimize(const command::CommandContext& ctx,
                            std::string_view raw) const override;
    bool is_fallback() const override { return true; }

private:
    GenericLimits limits_;
};

// ----------------------------------------------------------------------------
// Registry
// ----------------------------------------------------------------------------

class Registry {
public:
    /// Реестр из списка; если последний элемент не универсальный,
    /// в конец добавляется GenericOptimizer
    explicit Registry(std::vector<std::unique_ptr<Optimizer>> optimizers);

    /// git, file, build, docker (включённые в настройках), затем generic
    static Registry with_defaults(const Settings& settings = {});

    /// Первый подходящий оптимизатор; никогда не nullptr
    const Optimizer* select(const command::CommandContext& ctx) const;

    /// Первый подходящий специализированный оптимизатор или nullptr
    const Optimizer* select_specialized(const command::CommandContext& ctx) const;

    std::vector<std::string> names() const;
    size_t size() const { return optimizers_.size(); }

private:
    std::vector<std::unique_ptr<Optimizer>> optimizers_;
};

// ----------------------------------------------------------------------------
// Общие помощники
// ----------------------------------------------------------------------------

/// Первые max строк и строка "...+N more <what>"
std::string cap_lines(const std::vector<std::string>& lines, size_t max,
                      std::string_view what = "lines");

}  // namespace terse::optimizer

#endif  // TERSE_OPTIMIZER_HPP
