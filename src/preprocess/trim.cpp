// ==============================================================================
// trim.cpp - Стадия 5: нормализация пробелов
// ==============================================================================

#include "terse/preprocess.hpp"

#include "terse/text.hpp"

namespace terse::preprocess {

namespace {

/// Больше двух пустых строк подряд не бывает
constexpr size_t MAX_BLANK_RUN = 2;

}  // namespace

std::string normalize_whitespace(std::string_view input) {
    std::vector<std::string> out;
    size_t blank_run = 0;

    for (std::string_view line : text::split_lines(input)) {
        std::string_view trimmed = text::trim_end(line);
        if (trimmed.empty()) {
            ++blank_run;
            // пустые строки в начале не нужны
            if (!out.empty() && blank_run <= MAX_BLANK_RUN) {
                out.emplace_back();
            }
            continue;
        }
        blank_run = 0;
        out.emplace_back(trimmed);
    }

    while (!out.empty() && out.back().empty()) {
        out.pop_back();
    }
    return text::join_lines(out);
}

}  // namespace terse::preprocess
