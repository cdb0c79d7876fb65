// ==============================================================================
// generic.cpp - Универсальный оптимизатор
// ==============================================================================
//
// Подходит к любой команде. Короткий вывод (< min_size_bytes) возвращается
// как есть, остальной очищается от лишних пробелов и ограничивается по
// числу строк: ~2/3 головы, строка-пропуск, остаток хвоста.
//
// ==============================================================================

#include "terse/optimizer.hpp"

#include "terse/text.hpp"

namespace terse::optimizer {

namespace {

constexpr size_t MAX_CONSECUTIVE_BLANKS = 2;

std::string cleanup_whitespace(std::string_view input, size_t max_lines) {
    std::vector<std::string> lines;
    size_t blanks = 0;
    for (std::string_view line : text::split_lines(input)) {
        std::string_view t = text::trim_end(line);
        if (t.empty()) {
            if (++blanks <= MAX_CONSECUTIVE_BLANKS) {
                lines.emplace_back();
            }
            continue;
        }
        blanks = 0;
        lines.emplace_back(t);
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    const size_t total = lines.size();
    if (max_lines < 3 || total <= max_lines) {
        return text::join_lines(lines);
    }

    const size_t head = max_lines * 2 / 3;
    const size_t tail = max_lines - head - 1;
    std::vector<std::string> capped(lines.begin(),
                                    lines.begin() + static_cast<std::ptrdiff_t>(head));
    capped.push_back("\n... (" + std::to_string(total - head - tail) + " lines omitted, " +
                     std::to_string(total) + " total) ...\n");
    capped.insert(capped.end(), lines.end() - static_cast<std::ptrdiff_t>(tail), lines.end());
    return text::join_lines(capped);
}

}  // namespace

GenericOptimizer::GenericOptimizer(GenericLimits limits) : limits_(limits) {}

bool GenericOptimizer::can_handle(const command::CommandContext& ctx) const {
    (void)ctx;
    return true;
}

OptimizeResult GenericOptimizer::optimize(const command::CommandContext& ctx,
                                          std::string_view raw) const {
    (void)ctx;
    if (!limits_.enabled || raw.size() < limits_.min_size_bytes) {
        return OptimizeResult::success(std::string(raw));
    }
    return OptimizeResult::success(cleanup_whitespace(raw, limits_.max_lines));
}

}  // namespace terse::optimizer
