// ==============================================================================
// path_filter.cpp - Стадия 2: фильтрация путей в шумовых каталогах
// ==============================================================================
//
// Серия подряд идущих строк, ссылающихся на каталоги зависимостей и кэшей
// сборки (node_modules, target/debug/deps, __pycache__, ...), заменяется одной
// строкой-сводкой или удаляется. Строка с признаком ошибки остаётся на месте
// и разрывает серию.
//
// ==============================================================================

#include "terse/preprocess.hpp"

#include "terse/text.hpp"

#include <algorithm>
#include <stdexcept>

namespace terse::preprocess {

namespace {

constexpr std::string_view SUMMARY_MARKER = " in noise directories filtered";

// Максимум классов в строке-сводке
constexpr size_t MAX_SUMMARY_CLASSES = 3;

// Символы псевдографики tree (UTF-8)
constexpr const char* TREE_GLYPHS[] = {"\xe2\x94\x82", "\xe2\x94\x9c", "\xe2\x94\x94",
                                       "\xe2\x94\x80", "\xe2\x94\xac", "\xe2\x94\xa4",
                                       "\xe2\x94\x8c", "\xe2\x94\x90", "\xe2\x94\x98",
                                       "\xe2\x94\xb4"};

std::string bare_path(std::string_view line) {
    std::string s(text::trim(line));
    for (const char* glyph : TREE_GLYPHS) {
        size_t pos = 0;
        const std::string_view g(glyph);
        while ((pos = s.find(g, pos)) != std::string::npos) {
            s.erase(pos, g.size());
        }
    }
    std::replace(s.begin(), s.end(), '\\', '/');
    return s;
}

bool is_summary_line(std::string_view line) {
    std::string_view t = text::trim(line);
    return text::starts_with(t, "[") && t.find(SUMMARY_MARKER) != std::string_view::npos;
}

/// Совпавший фрагмент или пустая строка
std::string_view match_noise(std::string_view line, const std::vector<std::string>& extra) {
    if (text::trim(line).empty() || is_summary_line(line)) {
        return {};
    }
    const std::string path = bare_path(line);
    for (const auto& seg : default_noise_paths()) {
        if (path.find(seg) != std::string::npos) {
            return seg;
        }
    }
    for (const auto& seg : extra) {
        if (!seg.empty() && path.find(seg) != std::string::npos) {
            return seg;
        }
    }
    return {};
}

std::string summary_line(size_t count, const std::vector<std::string>& classes) {
    std::string line = "[" + std::to_string(count) + " path(s)" + std::string(SUMMARY_MARKER);
    if (!classes.empty()) {
        line += ": ";
        for (size_t i = 0; i < classes.size() && i < MAX_SUMMARY_CLASSES; ++i) {
            if (i > 0) {
                line += ", ";
            }
            line += classes[i];
        }
        if (classes.size() > MAX_SUMMARY_CLASSES) {
            line += ", ...";
        }
    }
    line += "]";
    return line;
}

}  // namespace

// ----------------------------------------------------------------------------
// PathFilterMode
// ----------------------------------------------------------------------------

std::string to_string(PathFilterMode mode) {
    return mode == PathFilterMode::Remove ? "remove" : "summary";
}

PathFilterMode parse_path_filter_mode(std::string_view s) {
    const std::string lower = text::to_lower(text::trim(s));
    if (lower == "summary") {
        return PathFilterMode::Summary;
    }
    if (lower == "remove") {
        return PathFilterMode::Remove;
    }
    throw std::invalid_argument("unknown path filter mode, must be: summary or remove");
}

const std::vector<std::string>& default_noise_paths() {
    static const std::vector<std::string> segments = {
        "node_modules",       ".git/objects",        ".git/refs",
        ".git/logs",          ".git/hooks",          "target/debug/deps",
        "target/debug/build", "target/debug/incremental",
        "target/release/deps", "target/release/build", "target/release/incremental",
        "__pycache__",        ".mypy_cache",         ".pytest_cache",
        ".tox/",              "dist/",               "build/lib",
        ".next/",             ".nuxt/",              ".cache/",
        "coverage/",          ".nyc_output",         "vendor/bundle",
        "Pods/",              ".gradle/",            "bin/Debug",
        "bin/Release",        "obj/Debug",           "obj/Release",
        ".vs/",               ".idea/",
    };
    return segments;
}

// ----------------------------------------------------------------------------
// filter_paths
// ----------------------------------------------------------------------------

std::string filter_paths(std::string_view input, PathFilterMode mode,
                         const std::vector<std::string>& extra_noise_paths) {
    const auto lines = text::split_lines(input);
    std::vector<std::string> kept;
    kept.reserve(lines.size());

    size_t i = 0;
    while (i < lines.size()) {
        std::string_view seg = match_noise(lines[i], extra_noise_paths);
        if (seg.empty() || text::has_failure_signal(lines[i])) {
            kept.emplace_back(lines[i]);
            ++i;
            continue;
        }

        size_t count = 0;
        std::vector<std::string> classes;
        while (i < lines.size()) {
            seg = match_noise(lines[i], extra_noise_paths);
            if (seg.empty() || text::has_failure_signal(lines[i])) {
                break;
            }
            if (std::find(classes.begin(), classes.end(), seg) == classes.end()) {
                classes.emplace_back(seg);
            }
            ++count;
            ++i;
        }
        if (mode == PathFilterMode::Summary) {
            kept.push_back(summary_line(count, classes));
        }
    }

    std::string out = text::join_lines(kept);
    if (!kept.empty() && text::ends_with(input, "\n")) {
        out += '\n';
    }
    return out;
}

}  // namespace terse::preprocess
