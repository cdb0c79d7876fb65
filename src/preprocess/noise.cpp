// ==============================================================================
// noise.cpp - Стадия 1: удаление шума
// ==============================================================================
//
// ANSI-последовательности, перезапись строки через `\r`, шаблонные строки
// менеджеров пакетов и сборщиков, декоративные линии (`=====`), индикаторы
// прогресса. Серии из трёх и более пустых строк схлопываются в одну.
//
// ==============================================================================

#include "terse/preprocess.hpp"

#include "terse/text.hpp"

#include <cctype>
#include <regex>

namespace terse::preprocess {

namespace {

// Всегда шум
constexpr const char* COMMON_BOILERPLATE[] = {
    "Blocking waiting for file lock",
    "npm warn",
    "npm notice",
};

// Шум сборки и установки зависимостей
constexpr const char* BUILD_BOILERPLATE[] = {
    "Compiling ",  "Downloading ", "Downloaded ", "Checking ",  "Fresh ",
    "Updating crates.io index",    "Unpacking ",  "Resolving ", "Installing ",
    "Auditing ",   "added ",       "removed ",    "changed ",   "up to date,",
};

// Полосы `[===>   ]` и проценты `73%`, `52.3%`
const std::regex& progress_regex() {
    static const std::regex re(R"(\[[\s=>#-]+\]|\b\d{1,3}(\.\d+)?%)", std::regex::ECMAScript);
    return re;
}

bool uses_build_boilerplate(Category hint) {
    return hint == Category::BuildTest || hint == Category::ContainerTools ||
           hint == Category::Generic;
}

std::string strip_ansi(std::string_view line) {
    if (line.find('\x1b') == std::string_view::npos) {
        return std::string(line);
    }
    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        if (line[i] != '\x1b') {
            out += line[i++];
            continue;
        }
        ++i;
        if (i >= line.size()) {
            break;
        }
        const char kind = line[i++];
        if (kind == '[') {
            // CSI: параметры, затем финальный байт 0x40..0x7E
            while (i < line.size() && (line[i] < 0x40 || line[i] > 0x7E)) {
                ++i;
            }
            if (i < line.size()) {
                ++i;
            }
        } else if (kind == ']') {
            // OSC: до BEL или ESC \ .
            while (i < line.size()) {
                if (line[i] == '\x07') {
                    ++i;
                    break;
                }
                if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '\\') {
                    i += 2;
                    break;
                }
                ++i;
            }
        } else if (kind == '(' || kind == ')') {
            if (i < line.size()) {
                ++i;
            }
        }
    }
    return out;
}

/// `a\rb\rc` -> `c`: на терминале видно только последнее состояние
std::string collapse_overwrite(std::string line) {
    size_t cr = line.rfind('\r');
    while (cr != std::string::npos) {
        if (cr + 1 < line.size()) {
            return line.substr(cr + 1);
        }
        line.resize(cr);
        cr = line.rfind('\r');
    }
    return line;
}

bool is_decoration_line(std::string_view line) {
    std::string_view t = text::trim(line);
    if (t.size() < 3) {
        return false;
    }
    const unsigned char first = static_cast<unsigned char>(t.front());
    if (first >= 0x80 || std::ispunct(first) == 0) {
        return false;
    }
    for (char c : t) {
        if (c != t.front()) {
            return false;
        }
    }
    return true;
}

bool is_progress_line(std::string_view line) {
    std::string_view t = text::trim(line);
    if (t.size() >= 120 || (t.find('%') == std::string_view::npos &&
                            t.find('[') == std::string_view::npos)) {
        return false;
    }
    const std::string s(t);
    if (!std::regex_search(s, progress_regex())) {
        return false;
    }
    const std::string rest = std::regex_replace(s, progress_regex(), "");
    return text::trim(rest).size() < 10 && !text::has_failure_signal(s);
}

bool is_boilerplate(std::string_view line, bool build_set,
                    const std::vector<std::string>& extra) {
    std::string_view t = text::trim_start(line);
    for (const char* p : COMMON_BOILERPLATE) {
        if (text::starts_with(t, p)) {
            return true;
        }
    }
    if (build_set) {
        for (const char* p : BUILD_BOILERPLATE) {
            if (text::starts_with(t, p)) {
                return true;
            }
        }
    }
    for (const auto& p : extra) {
        if (!p.empty() && text::starts_with(t, p)) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string strip_noise(std::string_view input, Category hint,
                        const std::vector<std::string>& extra_boilerplate) {
    const bool build_set = uses_build_boilerplate(hint);
    std::vector<std::string> kept;
    size_t blank_run = 0;

    for (std::string_view raw_line : text::split_lines(input)) {
        std::string line = collapse_overwrite(strip_ansi(raw_line));

        if (text::trim(line).empty()) {
            ++blank_run;
            kept.emplace_back();
            continue;
        }
        if (is_boilerplate(line, build_set, extra_boilerplate) || is_decoration_line(line) ||
            is_progress_line(line)) {
            continue;
        }

        // Три и более пустых подряд -> одна
        if (blank_run >= 3) {
            kept.resize(kept.size() - (blank_run - 1));
        }
        blank_run = 0;
        kept.push_back(std::move(line));
    }
    if (blank_run >= 3) {
        kept.resize(kept.size() - (blank_run - 1));
    }

    std::string out = text::join_lines(kept);
    if (!kept.empty() && text::ends_with(input, "\n")) {
        out += '\n';
    }
    return out;
}

}  // namespace terse::preprocess
