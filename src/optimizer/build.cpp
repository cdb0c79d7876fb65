// ==============================================================================
// build.cpp - Оптимизатор тестов, сборки и линтеров
// ==============================================================================
//
// Тесты:   провалы и ошибки дословно (с контекстом до пустой строки), успешные
//          тесты считаются, строки итогов сохраняются
// Сборка:  шаги компиляции и загрузки считаются, ошибки с контекстом
//          сохраняются, предупреждения ограничены
// Линтеры: только ошибки, предупреждения и итоговые строки
//
// ==============================================================================

#include "terse/optimizer.hpp"

#include "terse/text.hpp"

namespace terse::optimizer {

namespace {

constexpr const char* TEST_PREFIXES[] = {
    "cargo test",   "cargo nextest", "npm test",         "npm run test", "yarn test",
    "pnpm test",    "npx jest",      "npx vitest",       "dotnet test",  "pytest",
    "python -m pytest", "python3 -m pytest", "go test",  "mvn test",     "gradle test",
    "./gradlew test", "make test",   "nmake test",       "ctest",
};

constexpr const char* BUILD_PREFIXES[] = {
    "cargo build",    "cargo install",  "cargo check",    "npm install",   "npm ci",
    "npm run build",  "npx tsc",        "yarn install",   "yarn build",    "pnpm install",
    "pnpm build",     "dotnet build",   "dotnet restore", "dotnet publish", "go build",
    "mvn compile",    "mvn package",    "mvn install",    "gradle build",  "./gradlew build",
    "make",           "cmake",          "msbuild",        "nmake",         "nuget restore",
    "pip install",    "pip3 install",   "python -m pip",  "python3 -m pip", "ninja",
};

constexpr const char* LINT_PREFIXES[] = {
    "cargo clippy", "cargo fmt", "npx eslint", "npm run lint", "yarn lint", "dotnet format",
    "pylint",       "flake8",    "ruff check", "golint",       "go vet",    "mypy",
};

// Шаги компиляции и загрузки (нижний регистр)
constexpr const char* STEP_PREFIXES[] = {
    "compiling ", "downloading ", "downloaded ", "fresh ", "installing ", "resolving ",
    "updating ",
};

// Дополнительный шум менеджеров пакетов при сборке
constexpr const char* BUILD_NOISE_PREFIXES[] = {
    "added ",      "removed ",         "changed ",               "packages ",
    "npm warn",    "up to date",       "audited ",               "found 0 ",
    "restore complete", "determining projects", "restored ",    "collecting ",
    "using cached ", "requirement already satisfied",
};

template <size_t N>
bool starts_with_any(std::string_view s, const char* const (&prefixes)[N]) {
    for (const char* p : prefixes) {
        if (text::starts_with(s, p)) {
            return true;
        }
    }
    return false;
}

bool contains(std::string_view s, std::string_view needle) {
    return s.find(needle) != std::string_view::npos;
}

// ----------------------------------------------------------------------------
// Распознавание строк (по строке в нижнем регистре)
// ----------------------------------------------------------------------------

bool is_test_summary_line(std::string_view l) {
    return text::starts_with(l, "test result:") || text::starts_with(l, "test suites:") ||
           text::starts_with(l, "tests:") || text::starts_with(l, "time:") ||
           (contains(l, "passed") &&
            (contains(l, "failed") || contains(l, "error") || contains(l, "warning")) &&
            (text::starts_with(l, "=") || contains(l, " in "))) ||
           text::starts_with(l, "passed!") || text::starts_with(l, "failed!") ||
           text::starts_with(l, "total tests:") || text::starts_with(l, "ok  \t") ||
           text::starts_with(l, "fail\t") ||
           (contains(l, "passed") && contains(l, "failed") && l.size() < 100) ||
           text::starts_with(l, "build success") || text::starts_with(l, "build failure") ||
           text::starts_with(l, "tests run:");
}

bool is_failure_line(std::string_view l) {
    return contains(l, "... failed") || contains(l, "...failed") ||
           text::starts_with(l, "\xe2\x9c\x95") ||  // ✕
           text::starts_with(l, "\xc3\x97") ||      // ×
           (text::starts_with(l, "fail") && !text::starts_with(l, "fail\t")) ||
           (contains(l, "failed") &&
            (text::starts_with(l, "failed ") || text::starts_with(l, "f ") || contains(l, "::"))) ||
           text::starts_with(l, "--- fail:") ||
           (contains(l, "assertion") && (contains(l, "failed") || contains(l, "error"))) ||
           (text::starts_with(l, "thread '") && contains(l, "panicked"));
}

bool is_error_line(std::string_view l) {
    return text::starts_with(l, "error") || text::starts_with(l, "e ") ||
           contains(l, "error:") || contains(l, "error[") || text::starts_with(l, "fatal:");
}

bool is_warning_line(std::string_view l) {
    return text::starts_with(l, "warning") || text::starts_with(l, "warn ") ||
           contains(l, "warning:") || contains(l, "warning[");
}

bool is_pass_line(std::string_view l) {
    return contains(l, "... ok") || contains(l, "...ok") ||
           text::starts_with(l, "\xe2\x9c\x93") ||  // ✓
           text::starts_with(l, "\xe2\x9c\x94") ||  // ✔
           (text::starts_with(l, "pass") && !text::starts_with(l, "passed")) ||
           text::ends_with(l, "passed") || text::starts_with(l, "--- pass:") ||
           text::starts_with(l, "passed ");
}

// ----------------------------------------------------------------------------
// Сборка результата
// ----------------------------------------------------------------------------

void append_capped(std::vector<std::string>& out, const std::vector<std::string>& items,
                   size_t max, const char* what) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (i >= max) {
            out.push_back("...+" + std::to_string(items.size() - max) + " more " + what);
            break;
        }
        out.push_back(items[i]);
    }
}

/// Первые max_lines строк и "...(N lines omitted, T total)"
std::string truncate_output(std::string_view text_in, size_t max_lines) {
    const auto lines = text::split_lines(text_in);
    if (lines.size() <= max_lines) {
        return std::string(text_in);
    }
    std::string out;
    for (size_t i = 0; i < max_lines; ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i];
    }
    out += "\n...(" + std::to_string(lines.size() - max_lines) + " lines omitted, " +
           std::to_string(lines.size()) + " total)";
    return out;
}

std::string compact_test_output(std::string_view raw, const BuildLimits& limits) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "No test output";
    }

    std::vector<std::string> failures;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> summary;
    size_t passed = 0;
    size_t steps = 0;
    bool in_failure_block = false;

    for (std::string_view line : text::split_lines(trimmed)) {
        std::string_view l = text::trim(line);
        const std::string lower = text::to_lower(l);

        if (starts_with_any(lower, STEP_PREFIXES)) {
            ++steps;
            continue;
        }
        if (is_test_summary_line(lower)) {
            summary.emplace_back(l);
            in_failure_block = false;
            continue;
        }
        if (is_failure_line(lower)) {
            failures.emplace_back(l);
            in_failure_block = true;
            continue;
        }
        if (is_error_line(lower)) {
            errors.emplace_back(l);
            in_failure_block = true;
            continue;
        }
        if (is_warning_line(lower)) {
            warnings.emplace_back(l);
            continue;
        }
        if (in_failure_block) {
            // Контекст провала до пустой строки
            if (l.empty()) {
                in_failure_block = false;
            } else {
                failures.emplace_back(l);
            }
            continue;
        }
        if (is_pass_line(lower)) {
            ++passed;
        }
    }

    std::vector<std::string> out;
    if (steps > 0) {
        out.push_back("[" + std::to_string(steps) + " compilation steps]");
    }
    if (!failures.empty()) {
        out.emplace_back("FAILURES:");
        append_capped(out, failures, limits.test_max_failure_lines, "failure lines");
    }
    if (!errors.empty()) {
        out.emplace_back("ERRORS:");
        append_capped(out, errors, limits.test_max_error_lines, "error lines");
    }
    append_capped(out, warnings, limits.test_max_warnings, "warnings");
    if (passed > 0) {
        out.push_back("[" + std::to_string(passed) + " tests passed]");
    }
    out.insert(out.end(), summary.begin(), summary.end());

    if (out.empty()) {
        return truncate_output(trimmed, 50);
    }
    return text::join_lines(out);
}

std::string compact_build_output(std::string_view raw, const BuildLimits& limits) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "Build completed (no output)";
    }

    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> summary;
    size_t steps = 0;
    bool in_error_block = false;

    for (std::string_view line : text::split_lines(trimmed)) {
        std::string_view l = text::trim(line);
        const std::string lower = text::to_lower(l);

        if (starts_with_any(lower, STEP_PREFIXES) || starts_with_any(lower, BUILD_NOISE_PREFIXES)) {
            ++steps;
            continue;
        }
        if (text::starts_with(lower, "finished") || text::starts_with(lower, "build succeeded") ||
            text::starts_with(lower, "build success") || contains(lower, "compiled successfully") ||
            text::starts_with(lower, "successfully ")) {
            summary.emplace_back(l);
            in_error_block = false;
            continue;
        }
        if (is_error_line(lower)) {
            errors.emplace_back(l);
            in_error_block = true;
            continue;
        }
        if (in_error_block) {
            if (l.empty()) {
                in_error_block = false;
            } else {
                errors.emplace_back(l);
            }
            continue;
        }
        if (is_warning_line(lower)) {
            warnings.emplace_back(l);
        }
    }

    std::vector<std::string> out;
    if (steps > 0) {
        out.push_back("[" + std::to_string(steps) + " build steps]");
    }
    if (!errors.empty()) {
        out.emplace_back("ERRORS:");
        append_capped(out, errors, limits.build_max_error_lines, "error lines");
    }
    append_capped(out, warnings, limits.build_max_warnings, "warnings");
    out.insert(out.end(), summary.begin(), summary.end());

    if (out.empty()) {
        const std::string lower = text::to_lower(trimmed);
        if (contains(lower, "error") || contains(lower, "failed") || contains(lower, "fatal")) {
            return truncate_output(trimmed, 40);
        }
        return "Build succeeded";
    }
    return text::join_lines(out);
}

std::string compact_lint_output(std::string_view raw, const BuildLimits& limits) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "No lint issues found";
    }

    std::vector<std::string> issues;
    std::vector<std::string> summary;
    bool in_issue_block = false;

    for (std::string_view line : text::split_lines(trimmed)) {
        std::string_view l = text::trim(line);
        const std::string lower = text::to_lower(l);

        if (text::starts_with(lower, "checking ") || text::starts_with(lower, "compiling ") ||
            text::starts_with(lower, "finished")) {
            continue;
        }
        if ((text::starts_with(lower, "warning:") && contains(lower, "generated")) ||
            text::starts_with(lower, "error: could not compile") ||
            contains(lower, "problems found") || contains(lower, "errors and") ||
            contains(lower, "0 errors") || text::starts_with(lower, "found ")) {
            summary.emplace_back(l);
            in_issue_block = false;
            continue;
        }
        if (is_error_line(lower) || is_warning_line(lower)) {
            issues.emplace_back(l);
            in_issue_block = true;
            continue;
        }
        if (in_issue_block) {
            if (l.empty()) {
                in_issue_block = false;
            } else {
                issues.emplace_back(l);
            }
        }
    }

    std::vector<std::string> out;
    append_capped(out, issues, limits.lint_max_issue_lines, "issue lines");
    out.insert(out.end(), summary.begin(), summary.end());

    if (out.empty()) {
        const std::string lower = text::to_lower(trimmed);
        if (contains(lower, "error") || contains(lower, "warning")) {
            return truncate_output(trimmed, 40);
        }
        return "No lint issues found";
    }
    return text::join_lines(out);
}

}  // namespace

// ----------------------------------------------------------------------------
// BuildOptimizer
// ----------------------------------------------------------------------------

BuildOptimizer::BuildOptimizer(BuildLimits limits) : limits_(limits) {}

std::optional<BuildOptimizer::Kind> BuildOptimizer::classify(std::string_view core) {
    const std::string lower = text::to_lower(text::trim(core));
    // Тесты раньше сборки: `make test` не должен стать сборкой
    if (starts_with_any(lower, TEST_PREFIXES)) {
        return Kind::Test;
    }
    if (starts_with_any(lower, BUILD_PREFIXES)) {
        return Kind::Build;
    }
    if (starts_with_any(lower, LINT_PREFIXES)) {
        return Kind::Lint;
    }
    return std::nullopt;
}

bool BuildOptimizer::can_handle(const command::CommandContext& ctx) const {
    return classify(ctx.core).has_value();
}

OptimizeResult BuildOptimizer::optimize(const command::CommandContext& ctx,
                                        std::string_view raw) const {
    const auto kind = classify(ctx.core);
    if (!kind) {
        return OptimizeResult::failure("build command not supported by optimizer");
    }
    switch (*kind) {
    case Kind::Test:
        return OptimizeResult::success(compact_test_output(raw, limits_));
    case Kind::Build:
        return OptimizeResult::success(compact_build_output(raw, limits_));
    case Kind::Lint:
        return OptimizeResult::success(compact_lint_output(raw, limits_));
    }
    return OptimizeResult::failure("build command not supported by optimizer");
}

}  // namespace terse::optimizer
