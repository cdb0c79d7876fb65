// ==============================================================================
// classifier.cpp - Классификатор безопасности
// ==============================================================================

#include "terse/classifier.hpp"

#include "terse/text.hpp"

#include <algorithm>

namespace terse::safety {

namespace {

// Префиксы, после которых идёт настоящая программа
constexpr const char* TRANSPARENT_PREFIXES[] = {"sudo", "doas", "command", "exec",
                                                "nohup", "time", "nice"};

bool is_transparent_prefix(std::string_view word) {
    for (const char* p : TRANSPARENT_PREFIXES) {
        if (word == p) {
            return true;
        }
    }
    return false;
}

std::string strip_program_path(std::string_view word) {
    size_t slash = word.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        word = word.substr(slash + 1);
    }
    std::string lower = text::to_lower(word);
    if (text::ends_with(lower, ".exe")) {
        lower.resize(lower.size() - 4);
    }
    return lower;
}

}  // namespace

// ----------------------------------------------------------------------------
// NeverReason
// ----------------------------------------------------------------------------

std::string to_string(NeverReason reason) {
    switch (reason) {
    case NeverReason::LoopGuard:
        return "terse invocation (loop guard)";
    case NeverReason::DenyListed:
        return "destructive or editor command";
    case NeverReason::Redirection:
        return "output redirection";
    case NeverReason::Heredoc:
        return "contains heredoc";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// Deny-list
// ----------------------------------------------------------------------------

const std::vector<std::string>& builtin_deny_list() {
    static const std::vector<std::string> list = {
        // Удаление / перемещение (Unix, cmd.exe, PowerShell)
        "rm", "rmdir", "mv", "del", "erase", "rd", "ren", "move", "copy", "xcopy", "robocopy",
        "remove-item", "move-item", "rename-item", "ri", "mi", "set-content", "out-file",
        "add-content",
        // Интерактивные редакторы
        "vim", "vi", "nvim", "nano", "emacs", "code", "subl", "notepad", "notepad++"};
    return list;
}

std::string program_name(std::string_view core) {
    auto words = text::split_whitespace(core);
    size_t i = 0;
    while (i + 1 < words.size() && is_transparent_prefix(strip_program_path(words[i]))) {
        ++i;
        // sudo -u user cmd: пропускаем флаги префикса
        while (i + 1 < words.size() && text::starts_with(words[i], "-")) {
            ++i;
        }
    }
    if (words.empty()) {
        return {};
    }
    return strip_program_path(words[i]);
}

// ----------------------------------------------------------------------------
// Classifier
// ----------------------------------------------------------------------------

Classifier::Classifier(std::vector<std::string> extra_deny) {
    deny_ = builtin_deny_list();
    for (auto& p : extra_deny) {
        std::string lower = text::to_lower(text::trim(p));
        if (!lower.empty() && std::find(deny_.begin(), deny_.end(), lower) == deny_.end()) {
            deny_.push_back(std::move(lower));
        }
    }
}

bool Classifier::is_denied(std::string_view program) const {
    const std::string lower = text::to_lower(program);
    return std::find(deny_.begin(), deny_.end(), lower) != deny_.end();
}

Classification Classifier::classify(const command::CommandContext& ctx) const {
    // 1. Loop guard
    if (ctx.self_invocation) {
        return Classification::never(NeverReason::LoopGuard);
    }

    // 2. Deny-list по первому слову ядра
    const std::string program = program_name(ctx.core);
    if (!program.empty() && is_denied(program)) {
        return Classification::never(NeverReason::DenyListed, program);
    }

    // 3. Структура исходной строки
    if (command::contains_heredoc(ctx.original)) {
        return Classification::never(NeverReason::Heredoc);
    }
    if (command::has_output_redirect(ctx.original)) {
        return Classification::never(NeverReason::Redirection);
    }

    return Classification{};
}

}  // namespace terse::safety
