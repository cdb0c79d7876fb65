// ==============================================================================
// docker.cpp - Оптимизатор команд docker
// ==============================================================================
//
// ps / images: таблица по позициям колонок заголовка, лишние колонки
//              отбрасываются (с --format вывод уже настроен, не трогаем)
// logs:        строки ошибок отдельно + хвост
// build:       шаги считаются, ошибки и итоговые строки сохраняются
// pull / push: строки прогресса слоёв удаляются
//
// ==============================================================================

#include "terse/optimizer.hpp"

#include "terse/text.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace terse::optimizer {

namespace {

enum class DockerCommand { Ps, Images, Logs, ComposePs, Inspect, Build, PullPush, ListResource };

std::optional<DockerCommand> classify(std::string_view lower) {
    using text::starts_with;
    if (starts_with(lower, "docker compose ps") || starts_with(lower, "docker-compose ps")) {
        return DockerCommand::ComposePs;
    }
    if (starts_with(lower, "docker compose build") || starts_with(lower, "docker-compose build")) {
        return DockerCommand::Build;
    }
    if (starts_with(lower, "docker ps")) {
        return DockerCommand::Ps;
    }
    if (starts_with(lower, "docker images") || starts_with(lower, "docker image ls")) {
        return DockerCommand::Images;
    }
    if (starts_with(lower, "docker logs")) {
        return DockerCommand::Logs;
    }
    if (starts_with(lower, "docker inspect")) {
        return DockerCommand::Inspect;
    }
    if (starts_with(lower, "docker build")) {
        return DockerCommand::Build;
    }
    if (starts_with(lower, "docker pull") || starts_with(lower, "docker push")) {
        return DockerCommand::PullPush;
    }
    if (starts_with(lower, "docker network ls") || starts_with(lower, "docker network list") ||
        starts_with(lower, "docker volume ls") || starts_with(lower, "docker volume list")) {
        return DockerCommand::ListResource;
    }
    return std::nullopt;
}

bool has_format_flag(std::string_view lower) {
    for (std::string_view w : text::split_whitespace(lower)) {
        if (w == "--format" || text::starts_with(w, "--format=") || w == "-f") {
            return true;
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// Колонки таблиц
// ----------------------------------------------------------------------------

constexpr size_t NO_COLUMN = std::string_view::npos;

size_t find_column_start(std::string_view header, std::string_view name) {
    std::string upper(header);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return upper.find(name);
}

/// Значение колонки [start, end) строки; пустой optional если колонки нет
std::optional<std::string_view> extract_column(std::string_view line, size_t start, size_t end) {
    if (start == NO_COLUMN || start >= line.size()) {
        return std::nullopt;
    }
    size_t stop = std::min(end == NO_COLUMN ? line.size() : end, line.size());
    if (stop <= start) {
        return text::trim(line.substr(start));
    }
    return text::trim(line.substr(start, stop - start));
}

/// Обрезка по байтам с учётом границы UTF-8, без многоточия
std::string_view truncate_str(std::string_view s, size_t max) {
    if (s.size() <= max) {
        return s;
    }
    size_t end = max;
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) {
        --end;
    }
    return s.substr(0, end);
}

std::string trim_table_output(std::string_view text_in, size_t max_rows) {
    const auto lines = text::split_lines(text_in);
    if (lines.size() <= max_rows) {
        return std::string(text_in);
    }
    std::string out;
    for (size_t i = 0; i < max_rows; ++i) {
        out += lines[i];
        out += '\n';
    }
    out += "\n...+" + std::to_string(lines.size() - max_rows) + " more rows (" +
           std::to_string(lines.size()) + " total)";
    return out;
}

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

std::string compact_ps(std::string_view raw, size_t max_rows) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "No containers running";
    }
    const auto lines = text::split_lines(trimmed);
    if (lines.size() <= 1) {
        if (text::icontains(lines.front(), "container")) {
            return "No containers running";
        }
        return std::string(trimmed);
    }

    const std::string_view header = lines[0];
    const size_t name_col = find_column_start(header, "NAMES");
    const size_t image_col = find_column_start(header, "IMAGE");
    const size_t command_col = find_column_start(header, "COMMAND");
    const size_t status_col = find_column_start(header, "STATUS");
    const size_t ports_col = find_column_start(header, "PORTS");

    if (name_col == NO_COLUMN && image_col == NO_COLUMN) {
        return trim_table_output(trimmed, max_rows);
    }
    const size_t image_end = command_col != NO_COLUMN ? command_col : status_col;

    std::vector<std::string> out;
    out.emplace_back("NAME | IMAGE | STATUS | PORTS");
    size_t count = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        std::string_view line = lines[i];
        if (text::trim(line).empty()) {
            continue;
        }
        if (++count > max_rows) {
            continue;
        }
        const std::string_view name = extract_column(line, name_col, NO_COLUMN).value_or("-");
        const std::string_view image = extract_column(line, image_col, image_end).value_or("-");
        const std::string_view status = extract_column(line, status_col, ports_col).value_or("-");
        const std::string_view ports = extract_column(line, ports_col, name_col).value_or("-");

        std::string row(name);
        row += " | ";
        row += truncate_str(image, 40);
        row += " | ";
        row += status;
        row += " | ";
        row += ports.empty() ? std::string_view("-") : truncate_str(ports, 30);
        out.push_back(std::move(row));
    }
    if (count > max_rows) {
        out.push_back("...+" + std::to_string(count - max_rows) + " more (" +
                      std::to_string(count) + " total)");
    }
    return text::join_lines(out);
}

std::string compact_images(std::string_view raw, size_t max_images) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "No images";
    }
    const auto lines = text::split_lines(trimmed);
    if (lines.size() <= 1) {
        return "No images";
    }

    const std::string_view header = lines[0];
    const size_t repo_col = find_column_start(header, "REPOSITORY");
    const size_t tag_col = find_column_start(header, "TAG");
    const size_t id_col = find_column_start(header, "IMAGE ID");
    const size_t size_col = find_column_start(header, "SIZE");

    if (repo_col == NO_COLUMN) {
        return trim_table_output(trimmed, max_images);
    }

    std::vector<std::string> out;
    out.emplace_back("REPOSITORY:TAG | SIZE");
    size_t count = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        std::string_view line = lines[i];
        if (text::trim(line).empty()) {
            continue;
        }
        if (++count > max_images) {
            continue;
        }
        const std::string_view repo = extract_column(line, repo_col, tag_col).value_or("-");
        const std::string_view tag =
            extract_column(line, tag_col, id_col != NO_COLUMN ? id_col : size_col).value_or("-");
        const std::string_view size = extract_column(line, size_col, NO_COLUMN).value_or("-");

        std::string row(repo);
        row += ':';
        row += tag;
        row += " | ";
        row += size;
        out.push_back(std::move(row));
    }
    if (count > max_images) {
        out.push_back("...+" + std::to_string(count - max_images) + " more (" +
                      std::to_string(count) + " total)");
    }
    return text::join_lines(out);
}

std::string compact_logs(std::string_view raw, size_t max_tail, size_t max_errors) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "No logs";
    }
    const auto lines = text::split_lines(trimmed);
    const size_t total = lines.size();
    if (total <= max_tail + max_errors) {
        return std::string(trimmed);
    }

    std::vector<std::string> errors;
    for (std::string_view line : lines) {
        if (errors.size() >= max_errors) {
            break;
        }
        if (text::icontains(line, "error") || text::icontains(line, "fatal") ||
            text::icontains(line, "panic") || text::icontains(line, "exception") ||
            text::icontains(line, "traceback")) {
            errors.emplace_back(line);
        }
    }

    std::vector<std::string> out;
    if (!errors.empty()) {
        out.push_back("ERRORS/WARNINGS (" + std::to_string(errors.size()) + "):");
        out.insert(out.end(), errors.begin(), errors.end());
        out.emplace_back();
    }
    out.push_back("TAIL (" + std::to_string(max_tail) + " of " + std::to_string(total) +
                  " lines):");
    for (size_t i = total - max_tail; i < total; ++i) {
        out.emplace_back(lines[i]);
    }
    return text::join_lines(out);
}

std::string compact_compose_ps(std::string_view raw, size_t max_rows) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty() || text::split_lines(trimmed).size() <= 1) {
        return "No compose services running";
    }
    return trim_table_output(trimmed, max_rows);
}

std::string compact_inspect(std::string_view raw, size_t max_lines) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "No inspect output";
    }
    const auto lines = text::split_lines(trimmed);
    if (lines.size() <= max_lines) {
        return std::string(trimmed);
    }
    std::string out;
    for (size_t i = 0; i < max_lines; ++i) {
        out += lines[i];
        out += '\n';
    }
    out += "\n...(" + std::to_string(lines.size() - max_lines) + " lines omitted, " +
           std::to_string(lines.size()) + " total)";
    return out;
}

std::string compact_build(std::string_view raw) {
    constexpr size_t MAX_ERRORS = 20;

    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "Build completed (no output)";
    }

    std::vector<std::string> errors;
    std::vector<std::string> results;
    size_t steps = 0;
    for (std::string_view line : text::split_lines(trimmed)) {
        std::string_view l = text::trim(line);
        const std::string lower = text::to_lower(l);

        // Классический builder: "Step 3/7 : ..."; BuildKit: "#5 [2/4] RUN ..."
        if (text::starts_with(lower, "step ") ||
            (text::starts_with(lower, "#") && lower.find('[') != std::string::npos)) {
            ++steps;
            continue;
        }
        if (lower.find("error") != std::string::npos || lower.find("failed") != std::string::npos) {
            errors.emplace_back(l);
            continue;
        }
        if (text::starts_with(lower, "successfully") || text::starts_with(lower, "writing image") ||
            text::starts_with(lower, "naming to") || lower.find("built") != std::string::npos) {
            results.emplace_back(l);
        }
    }

    std::vector<std::string> out;
    if (steps > 0) {
        out.push_back("[" + std::to_string(steps) + " build steps]");
    }
    if (!errors.empty()) {
        out.emplace_back("ERRORS:");
        out.push_back(cap_lines(errors, MAX_ERRORS, "error lines"));
    }
    out.insert(out.end(), results.begin(), results.end());

    if (out.empty()) {
        return trim_table_output(trimmed, 30);
    }
    return text::join_lines(out);
}

constexpr const char* LAYER_PROGRESS[] = {
    ": pulling",       ": waiting",      ": downloading", ": extracting",
    ": verifying",     ": already exists", ": pull complete", ": pushed",
    ": preparing",     ": layer already exists", ": mounted from",
};

std::string compact_pull_push(std::string_view raw) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "completed";
    }
    const auto lines = text::split_lines(trimmed);
    std::vector<std::string> out;
    for (std::string_view line : lines) {
        std::string_view l = text::trim(line);
        const bool progress = std::any_of(std::begin(LAYER_PROGRESS), std::end(LAYER_PROGRESS),
                                          [&](const char* p) { return text::icontains(l, p); });
        if (!progress) {
            out.emplace_back(l);
        }
    }
    if (out.empty()) {
        return std::string(text::trim(lines.back()));
    }
    return text::join_lines(out);
}

std::string compact_resource_list(std::string_view raw, size_t max_rows) {
    std::string_view trimmed = text::trim(raw);
    if (trimmed.empty()) {
        return "No resources";
    }
    return trim_table_output(trimmed, max_rows);
}

}  // namespace

// ----------------------------------------------------------------------------
// DockerOptimizer
// ----------------------------------------------------------------------------

DockerOptimizer::DockerOptimizer(DockerLimits limits) : limits_(limits) {}

bool DockerOptimizer::can_handle(const command::CommandContext& ctx) const {
    const std::string lower = text::to_lower(ctx.core);
    const auto cmd = classify(lower);
    if (!cmd) {
        return false;
    }
    if (*cmd == DockerCommand::Ps || *cmd == DockerCommand::Images) {
        return !has_format_flag(lower);
    }
    return true;
}

OptimizeResult DockerOptimizer::optimize(const command::CommandContext& ctx,
                                         std::string_view raw) const {
    const auto cmd = classify(text::to_lower(ctx.core));
    if (!cmd) {
        return OptimizeResult::failure("docker command not supported by optimizer");
    }
    switch (*cmd) {
    case DockerCommand::Ps:
        return OptimizeResult::success(compact_ps(raw, limits_.ps_max_rows));
    case DockerCommand::Images:
        return OptimizeResult::success(compact_images(raw, limits_.images_max_rows));
    case DockerCommand::Logs:
        return OptimizeResult::success(
            compact_logs(raw, limits_.logs_max_tail, limits_.logs_max_errors));
    case DockerCommand::ComposePs:
        return OptimizeResult::success(compact_compose_ps(raw, limits_.compose_max_rows));
    case DockerCommand::Inspect:
        return OptimizeResult::success(compact_inspect(raw, limits_.inspect_max_lines));
    case DockerCommand::Build:
        return OptimizeResult::success(compact_build(raw));
    case DockerCommand::PullPush:
        return OptimizeResult::success(compact_pull_push(raw));
    case DockerCommand::ListResource:
        return OptimizeResult::success(compact_resource_list(raw, limits_.resource_max_rows));
    }
    return OptimizeResult::failure("docker command not supported by optimizer");
}

}  // namespace terse::optimizer
