// ==============================================================================
// dedup.cpp - Стадия 3: дедупликация
// ==============================================================================
//
// Три вида серий, проверяются в этом порядке:
// 1. одинаковые строки подряд -> одна строка с числом повторов
// 2. нумерованная последовательность `k/N` (одинаковое N, k растёт) ->
//    одна строка-сводка; строки с признаком ошибки остаются дословно
// 3. похожие строки (совпадает ключ шаблона, цифры заменены на `#`) ->
//    две первые строки и строка-сводка
//
// Строки-сводки ("[... ", "[steps ", "... (repeated N times)") в серии не входят.
// Строки сравниваются без хвостовых пробелов.
//
// ==============================================================================

#include "terse/preprocess.hpp"

#include "terse/text.hpp"

#include <cctype>

namespace terse::preprocess {

namespace {

/// Минимальная длина серии для сворачивания
constexpr size_t MIN_RUN_LENGTH = 3;

/// Сколько строк серии похожих строк остаётся дословно
constexpr size_t REPRESENTATIVE_LINES = 2;

/// Длина образца в строке-сводке
constexpr size_t SAMPLE_CHARS = 40;

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_marker(std::string_view line) {
    std::string_view t = text::trim(line);
    if (text::starts_with(t, "[... ") || text::starts_with(t, "[steps ")) {
        return true;
    }
    // `<line> (repeated N times)` из шага 1
    const size_t pos = t.rfind(" (repeated ");
    return pos != std::string_view::npos && text::ends_with(t, " times)");
}

bool is_plain(std::string_view line) {
    return !text::trim(line).empty() && !is_marker(line);
}

/// Ключ шаблона: серия цифр (и хвост hex после неё) -> `#`
std::string pattern_key(std::string_view line) {
    std::string_view t = text::trim(line);
    std::string key;
    key.reserve(t.size());
    size_t i = 0;
    while (i < t.size()) {
        if (is_digit(t[i])) {
            while (i < t.size() && is_hex(t[i])) {
                ++i;
            }
            key += '#';
        } else {
            key += t[i++];
        }
    }
    return key;
}

// ----------------------------------------------------------------------------
// Нумерованные последовательности
// ----------------------------------------------------------------------------

struct StepNumber {
    bool found = false;
    long k = 0;
    long n = 0;
};

/// Первое вхождение `k/N` с 1 <= k <= N и N >= 3
StepNumber find_step(std::string_view line) {
    StepNumber result;
    size_t i = 0;
    while (i < line.size()) {
        if (!is_digit(line[i]) || (i > 0 && is_digit(line[i - 1]))) {
            ++i;
            continue;
        }
        size_t j = i;
        long k = 0;
        while (j < line.size() && is_digit(line[j]) && j - i < 9) {
            k = k * 10 + (line[j] - '0');
            ++j;
        }
        if (j + 1 < line.size() && line[j] == '/' && is_digit(line[j + 1])) {
            size_t m = j + 1;
            long n = 0;
            while (m < line.size() && is_digit(line[m]) && m - j < 10) {
                n = n * 10 + (line[m] - '0');
                ++m;
            }
            if (n >= 3 && k >= 1 && k <= n) {
                result.found = true;
                result.k = k;
                result.n = n;
                return result;
            }
            i = m;
            continue;
        }
        i = j;
    }
    return result;
}

std::string steps_summary(long first, long last, long n) {
    return "[steps " + std::to_string(first) + "-" + std::to_string(last) + " of " +
           std::to_string(n) + " completed]";
}

/// Серия шагов [begin, end): успешные отрезки >= MIN_RUN_LENGTH сворачиваются,
/// строки с ошибкой и короткие отрезки остаются дословно
void emit_step_run(const std::vector<std::string_view>& lines, size_t begin, size_t end,
                   long n, std::vector<std::string>& out) {
    size_t i = begin;
    while (i < end) {
        if (text::has_failure_signal(lines[i])) {
            out.emplace_back(lines[i]);
            ++i;
            continue;
        }
        size_t j = i;
        while (j < end && !text::has_failure_signal(lines[j])) {
            ++j;
        }
        if (j - i >= MIN_RUN_LENGTH) {
            out.push_back(steps_summary(find_step(lines[i]).k, find_step(lines[j - 1]).k, n));
        } else {
            for (size_t x = i; x < j; ++x) {
                out.emplace_back(lines[x]);
            }
        }
        i = j;
    }
}

}  // namespace

std::string deduplicate(std::string_view input) {
    const auto lines = text::split_lines(input);
    std::vector<std::string> out;
    out.reserve(lines.size());

    size_t i = 0;
    while (i < lines.size()) {
        const std::string_view line = lines[i];
        if (!is_plain(line)) {
            out.emplace_back(line);
            ++i;
            continue;
        }

        // 1. Одинаковые строки
        const std::string_view bare = text::trim_end(line);
        size_t j = i + 1;
        while (j < lines.size() && text::trim_end(lines[j]) == bare) {
            ++j;
        }
        if (j - i >= 2) {
            out.push_back(std::string(bare) + " (repeated " + std::to_string(j - i) + " times)");
            i = j;
            continue;
        }

        // 2. Нумерованная последовательность
        const StepNumber step = find_step(line);
        if (step.found) {
            long prev = step.k;
            j = i + 1;
            while (j < lines.size() && is_plain(lines[j])) {
                const StepNumber next = find_step(lines[j]);
                if (!next.found || next.n != step.n || next.k <= prev) {
                    break;
                }
                prev = next.k;
                ++j;
            }
            if (j - i >= MIN_RUN_LENGTH) {
                emit_step_run(lines, i, j, step.n, out);
                i = j;
                continue;
            }
        }

        // 3. Похожие строки (без строк с ошибкой)
        if (!text::has_failure_signal(line)) {
            const std::string key = pattern_key(line);
            j = i + 1;
            while (j < lines.size() && is_plain(lines[j]) &&
                   !text::has_failure_signal(lines[j]) && pattern_key(lines[j]) == key) {
                ++j;
            }
            const size_t count = j - i;
            if (count >= MIN_RUN_LENGTH) {
                for (size_t x = i; x < i + REPRESENTATIVE_LINES; ++x) {
                    out.emplace_back(lines[x]);
                }
                const std::string sample =
                    text::truncate_chars(text::trim(line), SAMPLE_CHARS + 3);
                out.push_back("[... " + std::to_string(count - REPRESENTATIVE_LINES) +
                              " more similar line(s) matching \"" + sample + "\"]");
                i = j;
                continue;
            }
        }

        out.emplace_back(line);
        ++i;
    }

    std::string result = text::join_lines(out);
    if (!out.empty() && text::ends_with(input, "\n")) {
        result += '\n';
    }
    return result;
}

}  // namespace terse::preprocess
