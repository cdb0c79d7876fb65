// ==============================================================================
// category.cpp - Определение категории команды
// ==============================================================================

#include "terse/category.hpp"

#include "terse/text.hpp"

#include <initializer_list>

namespace terse {

namespace {

bool starts_with_any(std::string_view s, std::initializer_list<const char*> prefixes) {
    for (const char* p : prefixes) {
        if (text::starts_with(s, p)) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string to_string(Category category) {
    switch (category) {
    case Category::VersionControl:
        return "version_control";
    case Category::Logs:
        return "logs";
    case Category::FileOperations:
        return "file_operations";
    case Category::BuildTest:
        return "build_test";
    case Category::ContainerTools:
        return "container_tools";
    case Category::Generic:
        return "generic";
    }
    return "generic";
}

Category detect_category(std::string_view core) {
    const std::string lower = text::to_lower(text::trim(core));

    if (starts_with_any(lower, {"git ", "svn ", "hg "}) || lower == "git") {
        return Category::VersionControl;
    }
    // `tail -f` проверяется раньше файловых операций (`tail `)
    if (starts_with_any(lower, {"journalctl", "dmesg", "tail -f"})) {
        return Category::Logs;
    }
    if (starts_with_any(lower, {"ls", "dir", "find ", "cat ", "type ", "head ", "tail ", "wc ",
                                "tree", "du ", "df ", "file ", "stat ", "get-childitem",
                                "get-content"})) {
        return Category::FileOperations;
    }
    if (starts_with_any(lower, {"cargo ", "npm ", "npx ", "yarn ", "pnpm ", "dotnet ", "make",
                                "cmake ", "gradle ", "mvn ", "go ", "pytest", "python -m pytest",
                                "msbuild", "pip ", "pip3 "})) {
        return Category::BuildTest;
    }
    if (starts_with_any(lower, {"docker ", "podman ", "kubectl ", "helm "})) {
        return Category::ContainerTools;
    }
    if (lower.find("log") != std::string::npos) {
        return Category::Logs;
    }
    return Category::Generic;
}

}  // namespace terse
