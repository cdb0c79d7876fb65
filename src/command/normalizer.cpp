// ==============================================================================
// normalizer.cpp - Нормализация командной строки
// ==============================================================================
//
// Все проверки выполняются однопроходным сканером, который размечает каждый
// символ глубиной скобок (или -1, если символ внутри кавычек либо
// экранирован). Разделители `&&`, `;`, `|`, `>` и `<<` учитываются только на
// верхнем уровне.
//
// ==============================================================================

#include "terse/command.hpp"

#include "terse/text.hpp"

#include <cctype>
#include <vector>

namespace terse::command {

namespace {

// ----------------------------------------------------------------------------
// Сканер кавычек и скобок
// ----------------------------------------------------------------------------

struct Scan {
    std::vector<int> depth;  // -1: символ в кавычках или экранирован
    bool balanced = true;
};

Scan scan(std::string_view s) {
    Scan result;
    result.depth.assign(s.size(), -1);

    bool in_single = false;
    bool in_double = false;
    bool escaped = false;
    int depth = 0;

    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (in_single) {
            if (c == '\'') {
                in_single = false;
            }
            continue;
        }
        if (in_double) {
            if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_double = false;
            }
            continue;
        }
        switch (c) {
        case '\\':
            escaped = true;
            break;
        case '\'':
            in_single = true;
            break;
        case '"':
            in_double = true;
            break;
        case '(':
            result.depth[i] = depth;
            ++depth;
            break;
        case ')':
            --depth;
            if (depth < 0) {
                result.balanced = false;
                depth = 0;
            }
            result.depth[i] = depth;
            break;
        default:
            result.depth[i] = depth;
            break;
        }
    }

    if (in_single || in_double || escaped || depth != 0) {
        result.balanced = false;
    }
    return result;
}

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// ----------------------------------------------------------------------------
// Шаги снятия обёрток
// ----------------------------------------------------------------------------

/// `(cmd)` -> `cmd`, только если внешние скобки парные
std::string_view unwrap_subshell(std::string_view s) {
    s = text::trim(s);
    if (s.size() < 2 || s.front() != '(' || s.back() != ')') {
        return s;
    }
    const Scan sc = scan(s);
    if (!sc.balanced) {
        return s;
    }
    for (size_t i = 1; i + 1 < s.size(); ++i) {
        if (sc.depth[i] == 0) {
            return s;  // `(a) && (b)`
        }
    }
    return text::trim(s.substr(1, s.size() - 2));
}

/// Снять внешние кавычки; в двойных кавычках раскрываются экранированные `"` и `\`
std::string strip_outer_quotes(std::string_view s) {
    if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'') {
        return std::string(s.substr(1, s.size() - 2));
    }
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        std::string out;
        std::string_view inner = s.substr(1, s.size() - 2);
        out.reserve(inner.size());
        for (size_t i = 0; i < inner.size(); ++i) {
            if (inner[i] == '\\' && i + 1 < inner.size() &&
                (inner[i + 1] == '"' || inner[i + 1] == '\\' || inner[i + 1] == '$' ||
                 inner[i + 1] == '`')) {
                out += inner[i + 1];
                ++i;
            } else {
                out += inner[i];
            }
        }
        return out;
    }
    return std::string(s);
}

/// `bash -c "cmd"` / `sh -c 'cmd'` -> `cmd`
std::string unwrap_shell_wrapper(std::string_view s) {
    s = text::trim(s);
    auto words = text::split_whitespace(s);
    if (words.size() < 3) {
        return std::string(s);
    }

    std::string_view shell = words[0];
    size_t slash = shell.find_last_of('/');
    if (slash != std::string_view::npos) {
        shell = shell.substr(slash + 1);
    }
    const std::string shell_lower = text::to_lower(shell);
    if (shell_lower != "sh" && shell_lower != "bash" && shell_lower != "zsh" &&
        shell_lower != "dash") {
        return std::string(s);
    }
    const std::string flag = text::to_lower(words[1]);
    if (flag != "-c" && flag != "-lc" && flag != "-ec") {
        return std::string(s);
    }

    const size_t rest_pos = static_cast<size_t>(words[1].data() - s.data()) + words[1].size();
    return strip_outer_quotes(text::trim(s.substr(rest_pos)));
}

/// Последний непустой сегмент цепочки `&&` / `;` верхнего уровня
std::string_view last_chain_segment(std::string_view s) {
    const Scan sc = scan(s);
    std::vector<std::string_view> segments;
    size_t start = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (sc.depth[i] != 0) {
            continue;
        }
        if (s[i] == '&' && i + 1 < s.size() && s[i + 1] == '&' && sc.depth[i + 1] == 0) {
            segments.push_back(s.substr(start, i - start));
            start = i + 2;
            ++i;
        } else if (s[i] == ';') {
            segments.push_back(s.substr(start, i - start));
            start = i + 1;
        }
    }
    segments.push_back(s.substr(start));

    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
        std::string_view seg = text::trim(*it);
        if (!seg.empty()) {
            return seg;
        }
    }
    return text::trim(s);
}

/// Сегмент до первого одиночного `|` верхнего уровня (`||` не трогаем)
std::string_view first_pipe_segment(std::string_view s) {
    const Scan sc = scan(s);
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '|' || sc.depth[i] != 0) {
            continue;
        }
        const bool double_bar =
            (i + 1 < s.size() && s[i + 1] == '|') || (i > 0 && s[i - 1] == '|');
        const bool clobber = i > 0 && s[i - 1] == '>';
        if (double_bar || clobber) {
            continue;
        }
        std::string_view head = text::trim(s.substr(0, i));
        if (!head.empty()) {
            return head;
        }
        return text::trim(s);
    }
    return text::trim(s);
}

/// Снять ведущие `NAME=value`. Если присваивания занимают всю строку,
/// строка возвращается без изменений.
std::string_view strip_env_assignments(std::string_view s) {
    s = text::trim(s);
    size_t pos = 0;
    bool stripped = false;

    while (pos < s.size()) {
        size_t i = pos;
        if (!is_name_start(s[i])) {
            break;
        }
        while (i < s.size() && is_name_char(s[i])) {
            ++i;
        }
        if (i >= s.size() || s[i] != '=') {
            break;
        }
        ++i;  // '='

        // Значение: до пробела верхнего уровня, с учётом кавычек
        char quote = 0;
        while (i < s.size()) {
            const char c = s[i];
            if (quote != 0) {
                if (c == '\\' && quote == '"' && i + 1 < s.size()) {
                    i += 2;
                    continue;
                }
                if (c == quote) {
                    quote = 0;
                }
                ++i;
                continue;
            }
            if (c == '\'' || c == '"') {
                quote = c;
                ++i;
                continue;
            }
            if (c == '\\' && i + 1 < s.size()) {
                i += 2;
                continue;
            }
            if (is_blank(c)) {
                break;
            }
            ++i;
        }
        if (quote != 0) {
            return s;  // незакрытая кавычка в значении
        }

        while (i < s.size() && is_blank(s[i])) {
            ++i;
        }
        pos = i;
        stripped = true;
    }

    if (!stripped || pos >= s.size()) {
        return s;
    }
    return text::trim(s.substr(pos));
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// normalize
// ----------------------------------------------------------------------------

CommandContext normalize(std::string_view original) {
    CommandContext ctx;
    ctx.original = std::string(original);
    ctx.self_invocation = is_self_invocation(original);

    const std::string_view trimmed = text::trim(original);
    if (trimmed.empty()) {
        return ctx;
    }

    if (!is_balanced(trimmed)) {
        ctx.ambiguous = true;
        ctx.core = std::string(trimmed);
        return ctx;
    }

    std::string current(trimmed);
    for (int iteration = 0; iteration < MAX_UNWRAP_DEPTH; ++iteration) {
        std::string next(unwrap_subshell(current));
        next = unwrap_shell_wrapper(next);
        next = std::string(unwrap_subshell(next));

        // Внутренняя команда обёртки может оказаться несбалансированной
        if (!is_balanced(next)) {
            ctx.ambiguous = true;
            ctx.core = std::string(trimmed);
            return ctx;
        }

        next = std::string(last_chain_segment(next));
        next = std::string(first_pipe_segment(next));
        next = std::string(strip_env_assignments(next));

        if (next.empty() || next == current) {
            break;
        }
        current = std::move(next);
    }

    ctx.core = current.empty() ? std::string(trimmed) : current;
    return ctx;
}

std::string extract_core(std::string_view command) {
    return normalize(command).core;
}

// ----------------------------------------------------------------------------
// Структурные проверки
// ----------------------------------------------------------------------------

bool is_self_invocation(std::string_view command) {
    const std::string lower = text::to_lower(command);
    constexpr std::string_view NAME = "terse";

    size_t pos = 0;
    while ((pos = lower.find(NAME, pos)) != std::string::npos) {
        // "terse" должно начинать компонент пути или слово
        const bool boundary = pos == 0 || lower[pos - 1] == '/' || lower[pos - 1] == '\\' ||
                              lower[pos - 1] == '"' || lower[pos - 1] == '\'' ||
                              is_blank(lower[pos - 1]);
        size_t i = pos + NAME.size();
        pos = i;
        if (!boundary) {
            continue;
        }
        if (lower.compare(i, 4, ".exe") == 0) {
            i += 4;
        }
        if (i < lower.size() && (lower[i] == '"' || lower[i] == '\'')) {
            ++i;
        }
        size_t ws = i;
        while (ws < lower.size() && is_blank(lower[ws])) {
            ++ws;
        }
        if (ws == i || lower.compare(ws, 3, "run") != 0) {
            continue;
        }
        const size_t after = ws + 3;
        if (after == lower.size() || is_blank(lower[after]) || lower[after] == '"' ||
            lower[after] == '\'') {
            return true;
        }
    }
    return false;
}

bool contains_heredoc(std::string_view command) {
    const Scan sc = scan(command);
    for (size_t i = 0; i + 1 < command.size(); ++i) {
        if (command[i] == '<' && command[i + 1] == '<' && sc.depth[i] >= 0 &&
            sc.depth[i + 1] >= 0) {
            return true;
        }
    }
    return false;
}

bool has_output_redirect(std::string_view command) {
    const Scan sc = scan(command);
    for (size_t i = 0; i < command.size(); ++i) {
        if (command[i] != '>' || sc.depth[i] < 0) {
            continue;
        }
        if (i > 0 && command[i - 1] == '<') {
            continue;  // `<>`
        }
        if (i + 1 < command.size() && command[i + 1] == '&') {
            ++i;  // `2>&1`
            continue;
        }
        return true;
    }
    return false;
}

bool is_balanced(std::string_view command) {
    return scan(command).balanced;
}

}  // namespace terse::command
