// ==============================================================================
// validation.cpp - Проверка и очистка ответа LLM
// ==============================================================================

#include "terse/validation.hpp"

#include "terse/llm.hpp"
#include "terse/text.hpp"

#include <array>
#include <cstddef>

namespace terse::validation {

namespace {

constexpr std::array<const char*, 19> PREAMBLE_PREFIXES = {
    "here is the condensed", "here's the condensed",  "here is the optimized",
    "here's the optimized",  "here is the summarized", "here's the summarized",
    "here is the summary",   "here's the summary",     "here is the output",
    "here's the output",     "here is a condensed",    "here's a condensed",
    "here are the",          "sure, here",             "sure! here",
    "certainly!",            "certainly,",             "of course!",
    "of course,",
};

/// Маркеры, появление которых в ответе без такого же во входе означает выдумку
constexpr std::array<const char*, 4> STRUCTURAL_MARKERS = {
    "```",
    "diff --git",
    "@@ ",
    "## ",
};

bool has_preamble(std::string_view line) {
    const std::string lower = text::to_lower(text::trim(line));
    for (const char* prefix : PREAMBLE_PREFIXES) {
        if (text::starts_with(lower, prefix)) {
            return true;
        }
    }
    return false;
}

bool looks_like_command(std::string_view line) {
    const std::string lower = text::to_lower(text::trim(line));
    if (lower.empty()) {
        return false;
    }
    if (text::starts_with(lower, "$ ") || text::starts_with(lower, "> ") ||
        text::starts_with(lower, "% ")) {
        return true;
    }
    const bool git = text::starts_with(lower, "git ");
    if (git && lower.find(" -") != std::string::npos) {
        return true;
    }
    if (lower.find("--pretty=format:") != std::string::npos) {
        return true;
    }
    return git && lower.find(" | ") != std::string::npos;
}

/// Строки без отступов и пустых строк, в нижнем регистре
std::string normalize_for_echo(std::string_view s) {
    std::vector<std::string> kept;
    for (auto line : text::split_lines(s)) {
        auto t = text::trim(line);
        if (!t.empty()) {
            kept.emplace_back(t);
        }
    }
    return text::to_lower(text::join_lines(kept));
}

/// Заголовок markdown ("# ", "## ") в начале какой-либо строки
bool has_heading_line(std::string_view s) {
    for (auto line : text::split_lines(s)) {
        auto t = text::trim_start(line);
        if (text::starts_with(t, "# ") || text::starts_with(t, "## ")) {
            return true;
        }
    }
    return false;
}

bool contains_marker(std::string_view s, std::string_view marker) {
    if (marker == "## ") {
        return has_heading_line(s);
    }
    if (marker == "@@ ") {
        for (auto line : text::split_lines(s)) {
            if (text::starts_with(text::trim_start(line), marker)) {
                return true;
            }
        }
        return false;
    }
    return s.find(marker) != std::string_view::npos;
}

}  // namespace

const std::vector<std::string>& refusal_markers() {
    static const std::vector<std::string> markers = {
        "I apologize", "I'm sorry",       "As an AI",           "I cannot",
        "I can't fulfill", "I can't help", "I don't have access",
    };
    return markers;
}

const std::vector<std::string>& fabrication_markers() {
    static const std::vector<std::string> markers = {
        "this command will",  "this will output", "this outputs", "the above command",
        "the following command", "you can use",   "you can run",  "to achieve this",
        "--rules=",           "--remove-verbose",
    };
    return markers;
}

// ----------------------------------------------------------------------------
// Проверка
// ----------------------------------------------------------------------------

ValidationResult validate(std::string_view input, std::string_view candidate, Category category) {
    const auto trimmed = text::trim(candidate);
    if (trimmed.empty()) {
        return ValidationResult::reject("empty candidate");
    }

    const auto limit = static_cast<size_t>(static_cast<double>(input.size()) * MAX_LENGTH_RATIO);
    if (trimmed.size() > limit) {
        return ValidationResult::reject("candidate not shorter than input (" +
                                        std::to_string(trimmed.size()) + " of " +
                                        std::to_string(input.size()) + " bytes)");
    }

    for (const auto& marker : refusal_markers()) {
        if (text::icontains(trimmed, marker)) {
            return ValidationResult::reject("refusal marker: \"" + marker + "\"");
        }
    }
    for (const auto& marker : fabrication_markers()) {
        if (text::icontains(trimmed, marker)) {
            return ValidationResult::reject("fabrication marker: \"" + marker + "\"");
        }
    }

    const std::string example = normalize_for_echo(llm::template_for(category).example_after);
    if (!example.empty()) {
        const std::string norm = normalize_for_echo(trimmed);
        if (norm == example ||
            (example.size() > 10 && norm.find(example) != std::string::npos)) {
            return ValidationResult::reject("prompt example echoed back");
        }
    }

    for (const char* marker : STRUCTURAL_MARKERS) {
        if (contains_marker(trimmed, marker) && !contains_marker(input, marker)) {
            return ValidationResult::reject(std::string("structural marker absent from input: \"") +
                                            marker + "\"");
        }
    }

    return ValidationResult::accept();
}

// ----------------------------------------------------------------------------
// Очистка
// ----------------------------------------------------------------------------

std::string strip_preamble(std::string_view response) {
    const auto lines_view = text::split_lines(text::trim(response));
    size_t begin = 0;
    size_t end = lines_view.size();

    while (begin < end) {
        if (text::trim(lines_view[begin]).empty()) {
            ++begin;
            continue;
        }
        if (!has_preamble(lines_view[begin])) {
            break;
        }
        ++begin;
    }

    if (end - begin >= 2 && text::starts_with(text::trim(lines_view[begin]), "```") &&
        text::trim(lines_view[end - 1]) == "```") {
        ++begin;
        --end;
    }

    std::vector<std::string> kept;
    kept.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        kept.emplace_back(lines_view[i]);
    }
    return std::string(text::trim(text::join_lines(kept)));
}

std::string strip_command_lines(std::string_view response) {
    std::vector<std::string> kept;
    for (auto line : text::split_lines(text::trim(response))) {
        if (!looks_like_command(line)) {
            kept.emplace_back(line);
        }
    }
    return std::string(text::trim(text::join_lines(kept)));
}

std::string clean_response(std::string_view response) {
    return strip_command_lines(strip_preamble(response));
}

}  // namespace terse::validation
