// ==============================================================================
// truncation.cpp - Стадия 4: усечение по размеру
// ==============================================================================
//
// Если текст больше max_bytes, остаются голова (40%) и хвост (40%) бюджета,
// между ними одна строка-маркер. Строки с признаком ошибки из выброшенной
// середины сохраняются в пределах 10% бюджета. Результат всегда не больше
// max_bytes, поэтому повторный прогон ничего не меняет.
//
// ==============================================================================

#include "terse/preprocess.hpp"

#include "terse/text.hpp"

#include <algorithm>

namespace terse::preprocess {

namespace {

constexpr double HEAD_RATIO = 0.4;
constexpr double TAIL_RATIO = 0.4;
constexpr double FAILURE_RATIO = 0.1;

// Запас под строку-маркер
constexpr size_t MARKER_RESERVE = 96;

// Короткие тексты режутся по байтам
constexpr size_t MIN_LINES_FOR_LINE_MODE = 7;

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string byte_truncate(std::string_view text, size_t max_bytes) {
    const size_t budget = max_bytes > MARKER_RESERVE ? max_bytes - MARKER_RESERVE : 0;
    size_t head_end = budget / 2;
    size_t tail_begin = text.size() - budget / 2;
    while (head_end > 0 && is_continuation_byte(text[head_end])) {
        --head_end;
    }
    while (tail_begin < text.size() && is_continuation_byte(text[tail_begin])) {
        ++tail_begin;
    }
    const size_t omitted = tail_begin - head_end;

    std::string out(text.substr(0, head_end));
    out += "\n[... " + std::to_string(omitted) + " bytes truncated ...]\n";
    out += text.substr(tail_begin);
    return out;
}

}  // namespace

std::string truncate(std::string_view input, size_t max_bytes) {
    max_bytes = std::max(max_bytes, MIN_MAX_OUTPUT_BYTES);
    if (input.size() <= max_bytes) {
        return std::string(input);
    }

    const auto lines = text::split_lines(input);
    if (lines.size() < MIN_LINES_FOR_LINE_MODE) {
        return byte_truncate(input, max_bytes);
    }

    const size_t budget = max_bytes - MARKER_RESERVE;
    const auto head_budget = static_cast<size_t>(static_cast<double>(budget) * HEAD_RATIO);
    const auto tail_budget = static_cast<size_t>(static_cast<double>(budget) * TAIL_RATIO);
    const auto failure_budget = static_cast<size_t>(static_cast<double>(budget) * FAILURE_RATIO);

    size_t head_count = 0;
    size_t used = 0;
    while (head_count < lines.size() && used + lines[head_count].size() + 1 <= head_budget) {
        used += lines[head_count].size() + 1;
        ++head_count;
    }

    size_t tail_begin = lines.size();
    used = 0;
    while (tail_begin > head_count && used + lines[tail_begin - 1].size() + 1 <= tail_budget) {
        used += lines[tail_begin - 1].size() + 1;
        --tail_begin;
    }

    if (head_count >= tail_begin) {
        return byte_truncate(input, max_bytes);
    }

    // Строки ошибок из середины, по порядку, пока помещаются
    std::vector<size_t> kept_failures;
    used = 0;
    for (size_t i = head_count; i < tail_begin; ++i) {
        if (!text::has_failure_signal(lines[i])) {
            continue;
        }
        const size_t cost = lines[i].size() + 1;
        if (used + cost > failure_budget) {
            continue;
        }
        kept_failures.push_back(i);
        used += cost;
    }

    size_t omitted_lines = tail_begin - head_count - kept_failures.size();
    size_t omitted_bytes = 0;
    for (size_t i = head_count; i < tail_begin; ++i) {
        omitted_bytes += lines[i].size() + 1;
    }
    for (size_t i : kept_failures) {
        omitted_bytes -= lines[i].size() + 1;
    }

    std::vector<std::string> out;
    out.reserve(head_count + kept_failures.size() + (lines.size() - tail_begin) + 1);
    for (size_t i = 0; i < head_count; ++i) {
        out.emplace_back(lines[i]);
    }
    std::string marker = "[... " + std::to_string(omitted_lines) + " lines (" +
                         std::to_string(omitted_bytes) + " bytes) truncated";
    if (!kept_failures.empty()) {
        marker += ", " + std::to_string(kept_failures.size()) + " error line(s) kept";
    }
    marker += " ...]";
    out.push_back(std::move(marker));
    for (size_t i : kept_failures) {
        out.emplace_back(lines[i]);
    }
    for (size_t i = tail_begin; i < lines.size(); ++i) {
        out.emplace_back(lines[i]);
    }

    std::string result = text::join_lines(out);
    if (text::ends_with(input, "\n")) {
        result += '\n';
    }
    return result;
}

}  // namespace terse::preprocess
