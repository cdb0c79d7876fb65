// ==============================================================================
// git.cpp - Оптимизатор git (эталонный)
// ==============================================================================
//
// Подкоманды и стратегии:
// - status    подстановка `--porcelain -b`, сводка по группам файлов
// - log       подстановка `--oneline -n N` (только недостающие флаги)
// - diff      исходная команда, сводка по файлам и укороченные ханки
// - show      метаданные коммита, сводка и укороченные ханки
// - branch    список с отметкой текущей ветки, remote-only отдельно
// - stash     list/show компактно, остальное одной строкой
// - worktree  список без пустых строк
// - push / pull / fetch / add / commit  одна строка ok / failed
//
// ==============================================================================

#include "terse/optimizer.hpp"

#include "terse/text.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace terse::optimizer {

namespace {

enum class GitSubcommand { Status, Log, Diff, Branch, Show, Stash, Worktree, ShortStatus };

/// Подкоманда по словам ядра в нижнем регистре
std::optional<GitSubcommand> classify(const std::vector<std::string_view>& words) {
    if (words.size() < 2 || words[0] != "git") {
        return std::nullopt;
    }
    const std::string_view sub = words[1];
    if (sub == "status") {
        return GitSubcommand::Status;
    }
    if (sub == "log") {
        return GitSubcommand::Log;
    }
    if (sub == "diff") {
        return GitSubcommand::Diff;
    }
    if (sub == "branch") {
        return GitSubcommand::Branch;
    }
    if (sub == "show") {
        return GitSubcommand::Show;
    }
    if (sub == "stash") {
        return GitSubcommand::Stash;
    }
    if (sub == "worktree") {
        return GitSubcommand::Worktree;
    }
    if (sub == "push" || sub == "pull" || sub == "fetch" || sub == "add" || sub == "commit") {
        return GitSubcommand::ShortStatus;
    }
    return std::nullopt;
}

/// Слово совпадает с флагом или имеет вид `--flag=...`
bool has_flag(const std::vector<std::string_view>& words,
              std::initializer_list<const char*> flags) {
    for (std::string_view w : words) {
        for (const char* f : flags) {
            const std::string_view flag(f);
            if (w == flag) {
                return true;
            }
            if (text::starts_with(flag, "--") && w.size() > flag.size() &&
                text::starts_with(w, flag) && w[flag.size()] == '=') {
                return true;
            }
        }
    }
    return false;
}

/// `-n`, `-10`, `--max-count`
bool has_numeric_limit(const std::vector<std::string_view>& words) {
    for (std::string_view w : words) {
        if (w == "-n" || text::starts_with(w, "--max-count")) {
            return true;
        }
        if (w.size() > 1 && w[0] == '-' &&
            std::all_of(w.begin() + 1, w.end(),
                        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            return true;
        }
    }
    return false;
}

bool is_error_line(std::string_view line) {
    std::string_view t = text::trim_start(line);
    return text::starts_with(t, "fatal:") || text::starts_with(t, "error:");
}

bool has_error_line(std::string_view raw) {
    for (std::string_view line : text::split_lines(raw)) {
        if (is_error_line(line)) {
            return true;
        }
    }
    return false;
}

std::string first_non_empty_line(std::string_view raw) {
    for (std::string_view line : text::split_lines(raw)) {
        if (!text::trim(line).empty()) {
            return std::string(text::trim(line));
        }
    }
    return std::string(text::trim(raw));
}

// ----------------------------------------------------------------------------
// Status
// ----------------------------------------------------------------------------

struct StatusGroups {
    std::string branch;
    std::vector<std::string> staged;
    std::vector<std::string> modified;
    std::vector<std::string> untracked;
    size_t conflicts = 0;
};

void append_file_list(std::string& out, const std::vector<std::string>& files, size_t max) {
    const size_t shown = std::min(files.size(), max);
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += files[i];
    }
    if (files.size() > shown) {
        out += ", +" + std::to_string(files.size() - shown) + " more";
    }
}

std::string render_status(const StatusGroups& g) {
    std::string out;
    if (!g.branch.empty()) {
        out += "branch: " + g.branch + "\n";
    }
    if (g.staged.empty() && g.modified.empty() && g.untracked.empty() && g.conflicts == 0) {
        out += "clean";
        return out;
    }
    if (!g.staged.empty()) {
        out += "staged (" + std::to_string(g.staged.size()) + "): ";
        append_file_list(out, g.staged, 5);
        out += '\n';
    }
    if (!g.modified.empty()) {
        out += "modified (" + std::to_string(g.modified.size()) + "): ";
        append_file_list(out, g.modified, 5);
        out += '\n';
    }
    if (!g.untracked.empty()) {
        out += "untracked (" + std::to_string(g.untracked.size()) + "): ";
        append_file_list(out, g.untracked, 3);
        out += '\n';
    }
    if (g.conflicts > 0) {
        out += "conflicts: " + std::to_string(g.conflicts) + "\n";
    }
    return std::string(text::trim_end(out));
}

/// `## main...origin/main [ahead 1]` и строки `XY path`
std::string format_porcelain_status(std::string_view raw) {
    StatusGroups g;
    for (std::string_view line : text::split_lines(raw)) {
        if (text::starts_with(line, "## ")) {
            g.branch = std::string(line.substr(3));
            continue;
        }
        if (line.size() < 4) {
            continue;
        }
        const char x = line[0];
        const char y = line[1];
        std::string file(line.substr(3));
        if (x == '?' && y == '?') {
            g.untracked.push_back(std::move(file));
            continue;
        }
        if (x == 'U' || y == 'U' || (x == 'A' && y == 'A') || (x == 'D' && y == 'D')) {
            ++g.conflicts;
            continue;
        }
        if (x == 'M' || x == 'A' || x == 'D' || x == 'R' || x == 'C') {
            g.staged.push_back(file);
        }
        if (y == 'M' || y == 'D') {
            g.modified.push_back(std::move(file));
        }
    }
    return render_status(g);
}

bool looks_porcelain(std::string_view raw) {
    constexpr std::string_view STATUS_CODES = " MADRCU?!";
    for (std::string_view line : text::split_lines(raw)) {
        if (line.empty()) {
            continue;
        }
        if (text::starts_with(line, "## ")) {
            return true;
        }
        // `XY path`
        return line.size() >= 4 && line[2] == ' ' &&
               STATUS_CODES.find(line[0]) != std::string_view::npos &&
               STATUS_CODES.find(line[1]) != std::string_view::npos;
    }
    return false;
}

/// Обычный вывод `git status`, когда подстановка не выполнялась
std::string format_long_status(std::string_view raw) {
    enum class Section { None, Staged, Modified, Untracked, Unmerged };
    StatusGroups g;
    Section section = Section::None;
    std::string ahead_behind;

    for (std::string_view line : text::split_lines(raw)) {
        std::string_view t = text::trim(line);
        if (t.empty()) {
            continue;
        }
        if (text::starts_with(t, "On branch ")) {
            g.branch = std::string(t.substr(10));
            continue;
        }
        if (text::starts_with(t, "HEAD detached at ")) {
            g.branch = "HEAD (detached at " + std::string(t.substr(17)) + ")";
            continue;
        }
        if (text::starts_with(t, "Your branch is ahead of ") ||
            text::starts_with(t, "Your branch is behind ")) {
            const bool ahead = text::starts_with(t, "Your branch is ahead");
            const size_t by = t.find(" by ");
            if (by != std::string_view::npos) {
                auto words = text::split_whitespace(t.substr(by + 4));
                if (!words.empty()) {
                    ahead_behind =
                        std::string(ahead ? "ahead " : "behind ") + std::string(words[0]);
                }
            }
            continue;
        }
        if (text::starts_with(t, "Changes to be committed")) {
            section = Section::Staged;
            continue;
        }
        if (text::starts_with(t, "Changes not staged for commit")) {
            section = Section::Modified;
            continue;
        }
        if (text::starts_with(t, "Untracked files")) {
            section = Section::Untracked;
            continue;
        }
        if (text::starts_with(t, "Unmerged paths")) {
            section = Section::Unmerged;
            continue;
        }
        if (text::starts_with(t, "(") || text::starts_with(t, "Your branch") ||
            text::starts_with(t, "nothing ") || text::starts_with(t, "no changes")) {
            continue;
        }

        // `modified:   src/main.rs`, `new file:   x`, `renamed:    a -> b`
        std::string file(t);
        const size_t colon = t.find(":   ");
        if (colon != std::string_view::npos && section != Section::Untracked) {
            file = std::string(text::trim(t.substr(colon + 1)));
        }
        switch (section) {
        case Section::Staged:
            g.staged.push_back(std::move(file));
            break;
        case Section::Modified:
            g.modified.push_back(std::move(file));
            break;
        case Section::Untracked:
            g.untracked.push_back(std::move(file));
            break;
        case Section::Unmerged:
            ++g.conflicts;
            break;
        case Section::None:
            break;
        }
    }
    if (!ahead_behind.empty() && !g.branch.empty()) {
        g.branch += " (" + ahead_behind + ")";
    }
    return render_status(g);
}

// ----------------------------------------------------------------------------
// Log
// ----------------------------------------------------------------------------

bool is_hex_word(std::string_view w) {
    return w.size() >= 7 && std::all_of(w.begin(), w.end(), [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

/// Полный формат (`commit <sha>` / Author / Date / сообщение) -> одна строка
/// на коммит
std::string condense_full_log(std::string_view raw, const GitLimits& limits) {
    std::vector<std::string> entries;
    std::string sha;
    bool want_subject = false;

    for (std::string_view line : text::split_lines(raw)) {
        if (text::starts_with(line, "commit ")) {
            auto words = text::split_whitespace(line);
            if (words.size() >= 2 && is_hex_word(words[1])) {
                if (want_subject && !sha.empty()) {
                    entries.push_back(sha);
                }
                sha = std::string(words[1].substr(0, 7));
                want_subject = true;
                continue;
            }
        }
        if (want_subject && text::starts_with(line, "    ") && !text::trim(line).empty()) {
            entries.push_back(text::truncate_chars(sha + " " + std::string(text::trim(line)),
                                                   limits.log_line_max_chars));
            want_subject = false;
        }
    }
    if (want_subject && !sha.empty()) {
        entries.push_back(sha);
    }
    return cap_lines(entries, limits.log_max_entries, "commits");
}

std::string filter_log_output(std::string_view raw, const GitLimits& limits) {
    std::vector<std::string> lines;
    for (std::string_view line : text::split_lines(raw)) {
        if (text::trim(line).empty()) {
            continue;
        }
        lines.push_back(text::truncate_chars(line, limits.log_line_max_chars));
    }
    return cap_lines(lines, limits.log_max_entries, "commits");
}

std::string optimize_log(std::string_view raw, const GitLimits& limits) {
    if (text::trim(raw).empty()) {
        return "No commits";
    }
    for (std::string_view line : text::split_lines(raw)) {
        if (text::starts_with(line, "commit ")) {
            return condense_full_log(raw, limits);
        }
    }
    return filter_log_output(raw, limits);
}

// ----------------------------------------------------------------------------
// Diff
// ----------------------------------------------------------------------------

struct FileStat {
    std::string file;
    size_t added = 0;
    size_t removed = 0;
};

std::string plural(size_t n, const char* word) {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

/// Сводка как у `--stat`, без повторного запуска git
std::string generate_diff_stat(std::string_view diff) {
    std::vector<FileStat> files;
    for (std::string_view line : text::split_lines(diff)) {
        if (text::starts_with(line, "diff --git")) {
            FileStat fs;
            const size_t b = line.find(" b/");
            fs.file = b == std::string_view::npos ? "unknown" : std::string(line.substr(b + 3));
            files.push_back(std::move(fs));
        } else if (files.empty()) {
            continue;
        } else if (text::starts_with(line, "+") && !text::starts_with(line, "+++")) {
            ++files.back().added;
        } else if (text::starts_with(line, "-") && !text::starts_with(line, "---")) {
            ++files.back().removed;
        }
    }
    if (files.empty()) {
        return {};
    }

    std::string out;
    size_t total_added = 0;
    size_t total_removed = 0;
    for (const auto& f : files) {
        out += " " + f.file + " | +" + std::to_string(f.added) + " -" +
               std::to_string(f.removed) + "\n";
        total_added += f.added;
        total_removed += f.removed;
    }
    out += " " + plural(files.size(), "file") + " changed, " +
           plural(total_added, "insertion") + "(+), " + plural(total_removed, "deletion") + "(-)";
    return out;
}

/// Ханки без контекстных строк, не больше max_hunk строк изменений на ханк
std::string compact_diff_hunks(std::string_view diff, size_t max_hunk, size_t max_total) {
    std::vector<std::string> kept;
    size_t hunk_lines = 0;

    for (std::string_view line : text::split_lines(diff)) {
        if (text::starts_with(line, "diff --git") || text::starts_with(line, "@@ ")) {
            hunk_lines = 0;
            kept.emplace_back(line);
        } else if (text::starts_with(line, "--- ") || text::starts_with(line, "+++ ")) {
            kept.emplace_back(line);
        } else if (text::starts_with(line, "+") || text::starts_with(line, "-")) {
            ++hunk_lines;
            if (hunk_lines <= max_hunk) {
                kept.emplace_back(line);
            } else if (hunk_lines == max_hunk + 1) {
                kept.emplace_back("  ...(hunk truncated)");
            }
        }
        if (kept.size() >= max_total) {
            kept.emplace_back("...(diff truncated)");
            break;
        }
    }
    return text::join_lines(kept);
}

std::string compact_diff_with_stat(std::string_view raw, const GitLimits& limits) {
    if (text::trim(raw).empty()) {
        return "No changes";
    }
    const std::string stat = generate_diff_stat(raw);
    const std::string hunks =
        compact_diff_hunks(raw, limits.diff_max_hunk_lines, limits.diff_max_total_lines);
    if (stat.empty() && hunks.empty()) {
        return std::string(text::trim(raw));
    }
    std::string out = stat;
    if (!hunks.empty()) {
        if (!out.empty()) {
            out += "\n\n";
        }
        out += hunks;
    }
    return out;
}

// ----------------------------------------------------------------------------
// Show
// ----------------------------------------------------------------------------

std::string compact_show(std::string_view raw, const GitLimits& limits) {
    const size_t pos = raw.find("diff --git");
    if (pos == std::string_view::npos) {
        return std::string(text::trim(raw));
    }
    const std::string_view metadata = raw.substr(0, pos);
    const std::string_view diff = raw.substr(pos);

    std::string out;
    bool prev_blank = false;
    for (std::string_view line : text::split_lines(metadata)) {
        const bool blank = text::trim(line).empty();
        if (blank && prev_blank) {
            continue;
        }
        out += line;
        out += '\n';
        prev_blank = blank;
    }
    const std::string stat = generate_diff_stat(diff);
    if (!stat.empty()) {
        out += stat + "\n";
    }
    const std::string hunks =
        compact_diff_hunks(diff, limits.diff_max_hunk_lines, limits.diff_max_total_lines);
    if (!hunks.empty()) {
        out += "\n" + hunks;
    }
    return std::string(text::trim_end(out));
}

// ----------------------------------------------------------------------------
// Branch
// ----------------------------------------------------------------------------

std::string compact_branches(std::string_view raw, const GitLimits& limits) {
    std::string current;
    std::vector<std::string> local;
    std::vector<std::string> remote;

    for (std::string_view line : text::split_lines(raw)) {
        std::string_view t = text::trim(line);
        if (t.empty()) {
            continue;
        }
        if (text::starts_with(t, "* ")) {
            current = std::string(t.substr(2));
        } else if (text::starts_with(t, "remotes/")) {
            std::string_view name = t.substr(8);
            const size_t slash = name.find('/');
            if (slash != std::string_view::npos) {
                name = name.substr(slash + 1);
            }
            if (text::starts_with(name, "HEAD ")) {
                continue;
            }
            remote.emplace_back(name);
        } else {
            local.emplace_back(t);
        }
    }

    std::vector<std::string> out;
    const size_t total = std::max<size_t>(1, local.size() + (current.empty() ? 0 : 1));
    std::string header = "branches: " + std::to_string(total) + " local";
    if (!remote.empty()) {
        header += ", " + std::to_string(remote.size()) + " remote";
    }
    out.push_back(std::move(header));

    if (!current.empty()) {
        out.push_back("* " + current);
    }
    for (size_t i = 0; i < local.size() && i < limits.branch_max_local; ++i) {
        out.push_back("  " + local[i]);
    }
    if (local.size() > limits.branch_max_local) {
        out.push_back("  +" + std::to_string(local.size() - limits.branch_max_local) + " more");
    }

    std::vector<std::string> remote_only;
    for (const auto& r : remote) {
        if (r != current && std::find(local.begin(), local.end(), r) == local.end() &&
            std::find(remote_only.begin(), remote_only.end(), r) == remote_only.end()) {
            remote_only.push_back(r);
        }
    }
    if (!remote_only.empty()) {
        out.push_back("  remote-only (" + std::to_string(remote_only.size()) + "):");
        for (size_t i = 0; i < remote_only.size() && i < limits.branch_max_remote; ++i) {
            out.push_back("    " + remote_only[i]);
        }
        if (remote_only.size() > limits.branch_max_remote) {
            out.push_back("    +" + std::to_string(remote_only.size() - limits.branch_max_remote) +
                          " more");
        }
    }
    return text::join_lines(out);
}

// ----------------------------------------------------------------------------
// Stash / worktree / короткие операции
// ----------------------------------------------------------------------------

std::string compact_stash_list(std::string_view raw) {
    if (text::trim(raw).empty()) {
        return "No stashes";
    }
    std::vector<std::string> out;
    for (std::string_view line : text::split_lines(raw)) {
        std::string_view t = text::trim(line);
        if (t.empty()) {
            continue;
        }
        // stash@{0}: WIP on main: abc1234 message
        const size_t colon = t.find(": ");
        if (colon == std::string_view::npos) {
            out.emplace_back(t);
            continue;
        }
        std::string_view rest = t.substr(colon + 2);
        const size_t second = rest.find(": ");
        if (second != std::string_view::npos) {
            rest = rest.substr(second + 2);
        }
        out.push_back(std::string(t.substr(0, colon)) + ": " + std::string(text::trim(rest)));
    }
    return text::join_lines(out);
}

// Кроме `error:` / `fatal:`: отказ push и конфликт слияния
constexpr const char* GIT_FAILURE_PREFIXES[] = {
    "! [rejected]", "! [remote rejected]", "CONFLICT", "Automatic merge failed",
};

/// Есть строка, начинающаяся с маркера неудачи git
bool has_git_failure(std::string_view raw) {
    for (std::string_view line : text::split_lines(raw)) {
        if (is_error_line(line)) {
            return true;
        }
        std::string_view t = text::trim(line);
        for (const char* prefix : GIT_FAILURE_PREFIXES) {
            if (text::starts_with(t, prefix)) {
                return true;
            }
        }
    }
    return false;
}

std::string summarize_operation(std::string_view action, std::string_view raw) {
    if (has_git_failure(raw)) {
        return "git " + std::string(action) + ": failed - " + first_non_empty_line(raw);
    }
    return "git " + std::string(action) + ": ok";
}

std::string summarize_stash(std::string_view sub, std::string_view raw) {
    const std::string action = sub.empty() ? "push" : std::string(sub);
    if (has_git_failure(raw)) {
        return "git stash " + action + ": failed - " + first_non_empty_line(raw);
    }
    const std::string lower = text::to_lower(raw);
    if (lower.find("no local changes") != std::string::npos ||
        lower.find("no stash") != std::string::npos) {
        return "git stash " + action + ": nothing to stash";
    }
    return "git stash " + action + ": ok";
}

std::string compact_worktrees(std::string_view raw) {
    std::vector<std::string> out;
    for (std::string_view line : text::split_lines(raw)) {
        if (!text::trim(line).empty()) {
            out.emplace_back(text::trim(line));
        }
    }
    if (out.empty()) {
        return "No worktrees";
    }
    return text::join_lines(out);
}

}  // namespace

// ----------------------------------------------------------------------------
// GitOptimizer
// ----------------------------------------------------------------------------

GitOptimizer::GitOptimizer(GitLimits limits) : limits_(std::move(limits)) {}

bool GitOptimizer::can_handle(const command::CommandContext& ctx) const {
    const std::string lower = text::to_lower(ctx.core);
    const auto words = text::split_whitespace(lower);
    const auto sub = classify(words);
    if (!sub) {
        return false;
    }
    switch (*sub) {
    case GitSubcommand::Status:
        // Уже компактный или подробный формат
        return !has_flag(words, {"--short", "-s", "--porcelain", "-v", "--verbose"});
    case GitSubcommand::Diff:
        return !has_flag(words, {"--stat", "--numstat", "--shortstat", "--name-only",
                                 "--name-status"});
    case GitSubcommand::Branch:
        // Удаление, переименование, копирование
        return !has_flag(words, {"-d", "-D", "-m", "-M", "-c", "-C", "--delete", "--move"});
    case GitSubcommand::Show:
        return !has_flag(words, {"--stat", "--format", "--pretty"});
    case GitSubcommand::Worktree:
        return !has_flag(words, {"add", "remove", "prune", "lock", "unlock", "move"});
    default:
        return true;
    }
}

std::optional<std::string> GitOptimizer::substitute(const command::CommandContext& ctx) const {
    const std::string lower = text::to_lower(ctx.core);
    const auto words = text::split_whitespace(lower);
    const auto sub = classify(words);
    if (!sub || !can_handle(ctx)) {
        return std::nullopt;
    }

    // Хвост аргументов после `git <sub>` в исходном регистре
    const auto core_words = text::split_whitespace(ctx.core);
    const size_t rest_pos =
        static_cast<size_t>(core_words[1].data() - ctx.core.data()) + core_words[1].size();
    const std::string rest(ctx.core.substr(rest_pos));

    if (*sub == GitSubcommand::Status) {
        return "git status --porcelain -b" + rest;
    }
    if (*sub == GitSubcommand::Log) {
        const bool has_format = has_flag(words, {"--oneline", "--pretty", "--format"});
        const bool has_limit = has_numeric_limit(words);
        if (has_format && has_limit) {
            return std::nullopt;
        }
        std::string to = "git log";
        if (!has_format) {
            to += " --oneline";
        }
        if (!has_limit) {
            to += " -n " + std::to_string(limits_.log_default_limit);
        }
        return to + rest;
    }
    return std::nullopt;
}

OptimizeResult GitOptimizer::optimize(const command::CommandContext& ctx,
                                      std::string_view raw) const {
    const std::string lower = text::to_lower(ctx.core);
    const auto words = text::split_whitespace(lower);
    const auto sub = classify(words);
    if (!sub) {
        return OptimizeResult::failure("git command not supported by optimizer");
    }

    switch (*sub) {
    case GitSubcommand::Status:
        if (has_error_line(raw)) {
            return OptimizeResult::success(std::string(text::trim(raw)));
        }
        if (looks_porcelain(raw)) {
            return OptimizeResult::success(format_porcelain_status(raw));
        }
        return OptimizeResult::success(format_long_status(raw));
    case GitSubcommand::Log:
        if (has_error_line(raw)) {
            return OptimizeResult::success(std::string(text::trim(raw)));
        }
        return OptimizeResult::success(optimize_log(raw, limits_));
    case GitSubcommand::Diff:
        return OptimizeResult::success(compact_diff_with_stat(raw, limits_));
    case GitSubcommand::Branch:
        return OptimizeResult::success(compact_branches(raw, limits_));
    case GitSubcommand::Show:
        return OptimizeResult::success(compact_show(raw, limits_));
    case GitSubcommand::Stash: {
        const std::string_view action = words.size() > 2 ? words[2] : std::string_view{};
        if (action == "list") {
            return OptimizeResult::success(compact_stash_list(raw));
        }
        if (action == "show") {
            return OptimizeResult::success(compact_diff_with_stat(raw, limits_));
        }
        return OptimizeResult::success(summarize_stash(action, raw));
    }
    case GitSubcommand::Worktree:
        return OptimizeResult::success(compact_worktrees(raw));
    case GitSubcommand::ShortStatus:
        return OptimizeResult::success(summarize_operation(words[1], raw));
    }
    return OptimizeResult::failure("git command not supported by optimizer");
}

}  // namespace terse::optimizer
