// ==============================================================================
// file.cpp - Оптимизатор файловых команд
// ==============================================================================
//
// ls / dir / Get-ChildItem: длинный формат, простой список, таблица PowerShell
// find:                     первые N результатов
// cat / head / tail / type: голова и хвост файла
// wc:                       первые N строк и итог
// tree:                     шумовые подкаталоги сворачиваются в одну строку
//
// ==============================================================================

#include "terse/optimizer.hpp"

#include "terse/text.hpp"

#include <cctype>
#include <cstdio>
#include <initializer_list>

namespace terse::optimizer {

namespace {

enum class FileCommand { Ls, Find, Cat, Wc, Tree };

std::optional<FileCommand> classify(std::string_view lower_core) {
    const std::string_view first = text::first_word(lower_core);
    if (first == "ls" || first == "dir" || first == "gci" || first == "get-childitem") {
        return FileCommand::Ls;
    }
    if (first == "find") {
        return FileCommand::Find;
    }
    if (first == "cat" || first == "head" || first == "tail" || first == "type" ||
        first == "get-content" || first == "gc") {
        return FileCommand::Cat;
    }
    if (first == "wc") {
        return FileCommand::Wc;
    }
    if (first == "tree") {
        return FileCommand::Tree;
    }
    return std::nullopt;
}

bool has_any_word(std::string_view s, std::initializer_list<const char*> flags) {
    for (std::string_view w : text::split_whitespace(s)) {
        for (const char* f : flags) {
            if (w == f) {
                return true;
            }
        }
    }
    return false;
}

std::vector<std::string> non_empty_trimmed(std::string_view raw) {
    std::vector<std::string> out;
    for (std::string_view line : text::split_lines(raw)) {
        std::string_view t = text::trim(line);
        if (!t.empty()) {
            out.emplace_back(t);
        }
    }
    return out;
}

// ----------------------------------------------------------------------------
// ls
// ----------------------------------------------------------------------------

std::string human_size(unsigned long long bytes) {
    char buf[32];
    if (bytes < 1024ULL) {
        std::snprintf(buf, sizeof(buf), "%llu B", bytes);
    } else if (bytes < 1024ULL * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f KB", static_cast<double>(bytes) / 1024.0);
    } else if (bytes < 1024ULL * 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f MB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f GB",
                      static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
    }
    return buf;
}

bool is_dash_separator(std::string_view line) {
    std::string_view t = text::trim(line);
    if (t.empty()) {
        return false;
    }
    for (char c : t) {
        if (c != '-' && c != ' ' && c != '\t') {
            return false;
        }
    }
    return true;
}

/// Заголовок "Mode ... Name" и разделитель "----" в первых строках
bool is_powershell_format(const std::vector<std::string_view>& lines) {
    if (lines.size() < 3) {
        return false;
    }
    bool header = false;
    bool separator = false;
    for (size_t i = 0; i < lines.size() && i < 6; ++i) {
        if (i < 5 && lines[i].find("Mode") != std::string_view::npos &&
            lines[i].find("Name") != std::string_view::npos) {
            header = true;
        }
        if (is_dash_separator(lines[i])) {
            separator = true;
        }
    }
    return header && separator;
}

bool is_number(std::string_view w) {
    if (w.empty()) {
        return false;
    }
    for (char c : w) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

std::string compact_ls_powershell(const std::vector<std::string_view>& lines, size_t max_entries) {
    size_t name_col = 0;
    for (size_t i = 0; i < lines.size() && i < 5; ++i) {
        const size_t pos = lines[i].find("Name");
        if (pos != std::string_view::npos) {
            name_col = pos;
            break;
        }
    }

    std::vector<std::string> entries;
    size_t dirs = 0;
    size_t files = 0;
    for (std::string_view line : lines) {
        std::string_view t = text::trim(line);
        if (t.empty() || text::starts_with(t, "Directory:") || text::starts_with(t, "Mode") ||
            is_dash_separator(t)) {
            continue;
        }
        const auto words = text::split_whitespace(t);
        const bool is_dir = !words.empty() && text::starts_with(words[0], "d");
        std::string_view name = (name_col > 0 && line.size() > name_col)
                                    ? text::trim(line.substr(name_col))
                                    : words.back();
        if (name.empty() || name == "Name") {
            continue;
        }

        if (is_dir) {
            ++dirs;
            entries.push_back("[D] " + std::string(name));
            continue;
        }
        ++files;
        std::string entry = "    " + std::string(name);
        // Length - последнее число перед именем
        for (size_t i = words.size(); i-- > 1;) {
            if (i + 1 < words.size() && is_number(words[i]) && words[i].size() <= 18) {
                entry += "  (" + human_size(std::stoull(std::string(words[i]))) + ")";
                break;
            }
        }
        entries.push_back(std::move(entry));
    }

    if (entries.empty()) {
        return "(empty directory)";
    }
    std::string out = std::to_string(dirs) + " directories, " + std::to_string(files) + " files";
    const size_t total = entries.size();
    for (size_t i = 0; i < total && i < max_entries; ++i) {
        out += "\n" + entries[i];
    }
    if (total > max_entries) {
        out += "\n...+" + std::to_string(total - max_entries) + " more (" + std::to_string(total) +
               " total)";
    }
    return out;
}

bool is_long_format_line(std::string_view line) {
    std::string_view t = text::trim(line);
    if (text::starts_with(t, "total ")) {
        return true;
    }
    return t.size() > 10 && (t[0] == 'd' || t[0] == '-' || t[0] == 'l') &&
           (t[1] == 'r' || t[1] == '-');
}

std::string compact_ls(std::string_view raw, const FileLimits& limits) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "(empty directory)";
    }
    const auto lines = text::split_lines(trimmed);
    if (is_powershell_format(lines)) {
        return compact_ls_powershell(lines, limits.ls_max_entries);
    }

    bool long_format = false;
    for (std::string_view line : lines) {
        if (is_long_format_line(line)) {
            long_format = true;
            break;
        }
    }

    std::vector<std::string> items;
    for (std::string_view line : lines) {
        std::string_view t = text::trim(line);
        if (t.empty() || (long_format && text::starts_with(t, "total "))) {
            continue;
        }
        items.emplace_back(t);
    }
    if (items.empty()) {
        return "(empty directory)";
    }

    const size_t max = long_format ? limits.ls_max_entries : limits.ls_max_items;
    const size_t total = items.size();
    if (total <= max) {
        return text::join_lines(items);
    }
    items.resize(max);
    std::string out = text::join_lines(items);
    out += "\n...+" + std::to_string(total - max) + (long_format ? " more entries (" : " more (") +
           std::to_string(total) + " total)";
    return out;
}

// ----------------------------------------------------------------------------
// find / cat / wc
// ----------------------------------------------------------------------------

std::string compact_find(std::string_view raw, size_t max_results) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "No files found";
    }
    const auto lines = text::split_lines(trimmed);
    if (lines.size() <= max_results) {
        return std::string(trimmed);
    }
    std::string out;
    for (size_t i = 0; i < max_results; ++i) {
        out += lines[i];
        out += '\n';
    }
    out += "...+" + std::to_string(lines.size() - max_results) + " more (" +
           std::to_string(lines.size()) + " total)";
    return out;
}

std::string compact_cat(std::string_view raw, const FileLimits& limits) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "(empty file)";
    }
    const auto lines = text::split_lines(trimmed);
    const size_t total = lines.size();
    if (total <= limits.cat_max_lines || limits.cat_head_lines + limits.cat_tail_lines >= total) {
        return std::string(trimmed);
    }

    std::string out;
    for (size_t i = 0; i < limits.cat_head_lines; ++i) {
        out += lines[i];
        out += '\n';
    }
    out += "... (" + std::to_string(total - limits.cat_head_lines - limits.cat_tail_lines) +
           " lines omitted, " + std::to_string(total) + " total) ...\n";
    for (size_t i = total - limits.cat_tail_lines; i < total; ++i) {
        out += lines[i];
        out += '\n';
    }
    return std::string(text::trim_end(out));
}

std::string compact_wc(std::string_view raw, size_t max_lines) {
    auto lines = non_empty_trimmed(raw);
    if (lines.empty()) {
        return "0";
    }
    if (lines.size() <= max_lines || max_lines < 2) {
        return text::join_lines(lines);
    }
    // Первые строки и итоговая (обычно последняя)
    const size_t total = lines.size();
    std::string last = lines.back();
    lines.resize(max_lines - 1);
    lines.push_back(std::move(last));
    return text::join_lines(lines) + "\n..." + std::to_string(total) + " files total";
}

// ----------------------------------------------------------------------------
// tree
// ----------------------------------------------------------------------------

struct TreePrefix {
    size_t bytes = 0;  // длина префикса в байтах
    size_t depth = 0;  // длина префикса в символах
};

/// Отступ и псевдографика в начале строки tree
TreePrefix tree_prefix(std::string_view line) {
    constexpr const char* GLYPHS[] = {"\xe2\x94\x82", "\xe2\x94\x9c", "\xe2\x94\x94",
                                      "\xe2\x94\x80", "\xc2\xa0"};
    TreePrefix p;
    while (p.bytes < line.size()) {
        const char c = line[p.bytes];
        if (c == ' ' || c == '|' || c == '+' || c == '`' || c == '-' || c == '\t') {
            ++p.bytes;
            ++p.depth;
            continue;
        }
        bool matched = false;
        for (const char* g : GLYPHS) {
            if (text::starts_with(line.substr(p.bytes), g)) {
                p.bytes += std::string_view(g).size();
                ++p.depth;
                matched = true;
                break;
            }
        }
        if (!matched) {
            break;
        }
    }
    return p;
}

bool is_noise_dir(std::string_view name, const std::vector<std::string>& noise_dirs) {
    if (text::ends_with(name, "/")) {
        name.remove_suffix(1);
    }
    for (const auto& d : noise_dirs) {
        if (text::iequals(name, d)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> prune_tree_noise(const std::vector<std::string_view>& lines,
                                          const std::vector<std::string>& noise_dirs) {
    std::vector<std::string> out;
    out.reserve(lines.size());
    bool skipping = false;
    size_t skip_depth = 0;

    for (std::string_view line : lines) {
        const TreePrefix p = tree_prefix(line);
        if (skipping) {
            if (p.depth > skip_depth) {
                continue;
            }
            skipping = false;
        }
        const std::string_view name = text::trim(line.substr(p.bytes));
        if (!name.empty() && is_noise_dir(name, noise_dirs)) {
            std::string_view bare = name;
            if (text::ends_with(bare, "/")) {
                bare.remove_suffix(1);
            }
            out.push_back(std::string(line.substr(0, p.bytes)) + std::string(bare) +
                          "/ [contents hidden]");
            skipping = true;
            skip_depth = p.depth;
            continue;
        }
        out.emplace_back(line);
    }
    return out;
}

std::string compact_tree(std::string_view raw, const FileLimits& limits) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "(empty)";
    }
    const auto lines = text::split_lines(trimmed);
    const auto& noise = limits.tree_noise_dirs.empty() ? default_tree_noise_dirs()
                                                       : limits.tree_noise_dirs;
    std::vector<std::string> pruned = prune_tree_noise(lines, noise);

    const size_t total_original = lines.size();
    const size_t total_pruned = pruned.size();
    const size_t max = limits.tree_max_lines < 2 ? 2 : limits.tree_max_lines;
    if (total_pruned <= max) {
        return text::join_lines(pruned);
    }

    const std::string last = pruned.back();
    pruned.resize(max - 1);
    std::string out = text::join_lines(pruned);

    // Итоговая строка "N directories, M files" сохраняется
    if (last.find("director") != std::string::npos || last.find("file") != std::string::npos) {
        out += "\n\n" + last + "\n...(" + std::to_string(total_pruned - max) + " lines omitted)";
        if (total_pruned < total_original) {
            out += " (" + std::to_string(total_original - total_pruned) + " noise lines pruned)";
        }
        return out;
    }
    out += "\n...+" + std::to_string(total_pruned - max + 1) + " more lines (" +
           std::to_string(total_original) + " total)";
    return out;
}

}  // namespace

const std::vector<std::string>& default_tree_noise_dirs() {
    static const std::vector<std::string> dirs = {
        "node_modules", ".git",       "__pycache__", ".mypy_cache", ".pytest_cache",
        ".tox",         ".next",      ".nuxt",       ".cache",      "coverage",
        ".nyc_output",  "vendor",     "Pods",        ".gradle",     ".idea",
        ".vs",          ".vscode",    "bin",         "obj",         "target",
        "dist",         "build",      ".angular",    ".svn",        ".hg",
        ".terraform",   ".serverless",
    };
    return dirs;
}

// ----------------------------------------------------------------------------
// FileOptimizer
// ----------------------------------------------------------------------------

FileOptimizer::FileOptimizer(FileLimits limits) : limits_(std::move(limits)) {}

bool FileOptimizer::can_handle(const command::CommandContext& ctx) const {
    const std::string lower = text::to_lower(ctx.core);
    const auto cmd = classify(lower);
    if (!cmd) {
        return false;
    }
    if (*cmd == FileCommand::Ls) {
        // Пользователь уже выбрал формат вывода (флаги регистрозависимы)
        return !has_any_word(ctx.core, {"-1", "--format", "-C", "-m", "-x"});
    }
    return true;
}

OptimizeResult FileOptimizer::optimize(const command::CommandContext& ctx,
                                       std::string_view raw) const {
    const auto cmd = classify(text::to_lower(ctx.core));
    if (!cmd) {
        return OptimizeResult::failure("file command not supported by optimizer");
    }
    switch (*cmd) {
    case FileCommand::Ls:
        return OptimizeResult::success(compact_ls(raw, limits_));
    case FileCommand::Find:
        return OptimizeResult::success(compact_find(raw, limits_.find_max_results));
    case FileCommand::Cat:
        return OptimizeResult::success(compact_cat(raw, limits_));
    case FileCommand::Wc:
        return OptimizeResult::success(compact_wc(raw, limits_.wc_max_lines));
    case FileCommand::Tree:
        return OptimizeResult::success(compact_tree(raw, limits_));
    }
    return OptimizeResult::failure("file command not supported by optimizer");
}

}  // namespace terse::optimizer
