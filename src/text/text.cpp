// ==============================================================================
// text.cpp - Строковые утилиты и оценка токенов
// ==============================================================================

#include "terse/text.hpp"

#include <algorithm>
#include <cctype>

namespace terse::text {

namespace {

char lower_ascii(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Маркеры ошибок (в нижнем регистре)
constexpr const char* FAILURE_MARKERS[] = {
    "error", "fail", "fatal", "panic", "exception", "traceback", "denied", "abort",
};

// Символы неудачи в UTF-8: ✕ ✗ ✘
constexpr const char* FAILURE_GLYPHS[] = {"\xe2\x9c\x95", "\xe2\x9c\x97", "\xe2\x9c\x98"};

}  // namespace

// ----------------------------------------------------------------------------
// Регистр и пробелы
// ----------------------------------------------------------------------------

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(), lower_ascii);
    return result;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (lower_ascii(a[i]) != lower_ascii(b[i])) {
            return false;
        }
    }
    return true;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool icontains(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) {
        return true;
    }
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string_view trim_start(std::string_view s) {
    size_t i = 0;
    while (i < s.size() && is_space(s[i])) {
        ++i;
    }
    return s.substr(i);
}

std::string_view trim_end(std::string_view s) {
    size_t n = s.size();
    while (n > 0 && is_space(s[n - 1])) {
        --n;
    }
    return s.substr(0, n);
}

std::string_view trim(std::string_view s) {
    return trim_end(trim_start(s));
}

// ----------------------------------------------------------------------------
// Строки
// ----------------------------------------------------------------------------

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = (nl == std::string_view::npos) ? text.size() : nl;
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (nl == std::string_view::npos) {
            break;
        }
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string result;
    size_t total = 0;
    for (const auto& l : lines) {
        total += l.size() + 1;
    }
    result.reserve(total);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

std::vector<std::string_view> split_whitespace(std::string_view s) {
    std::vector<std::string_view> words;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) {
            ++i;
        }
        size_t start = i;
        while (i < s.size() && !is_space(s[i])) {
            ++i;
        }
        if (i > start) {
            words.push_back(s.substr(start, i - start));
        }
    }
    return words;
}

std::string_view first_word(std::string_view s) {
    s = trim_start(s);
    size_t i = 0;
    while (i < s.size() && !is_space(s[i])) {
        ++i;
    }
    return s.substr(0, i);
}

bool replace_first(std::string& s, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return false;
    }
    size_t pos = s.find(from);
    if (pos == std::string::npos) {
        return false;
    }
    s.replace(pos, from.size(), to);
    return true;
}

std::string truncate_chars(std::string_view s, size_t max_chars) {
    if (s.size() <= max_chars) {
        return std::string(s);
    }
    size_t cut = max_chars >= 3 ? max_chars - 3 : 0;
    // Не резать посреди многобайтовой последовательности UTF-8
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string result(s.substr(0, cut));
    result += "...";
    return result;
}

// ----------------------------------------------------------------------------
// Токены
// ----------------------------------------------------------------------------

size_t estimate_tokens(std::string_view text) {
    return (text.size() + 3) / 4;
}

double savings_pct(size_t original_tokens, size_t optimized_tokens) {
    if (original_tokens == 0 || optimized_tokens >= original_tokens) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(original_tokens - optimized_tokens) /
           static_cast<double>(original_tokens);
}

// ----------------------------------------------------------------------------
// Сигналы
// ----------------------------------------------------------------------------

bool has_failure_signal(std::string_view line) {
    for (const char* glyph : FAILURE_GLYPHS) {
        if (line.find(glyph) != std::string_view::npos) {
            return true;
        }
    }
    const std::string lower = to_lower(line);
    for (const char* marker : FAILURE_MARKERS) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace terse::text
