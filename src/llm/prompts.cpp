// ==============================================================================
// prompts.cpp - Промпты Smart path по категориям команд
// ==============================================================================

#include "terse/llm.hpp"

namespace terse::llm {

namespace {

constexpr PromptTemplate VERSION_CONTROL = {
    "You are a concise output condenser for an AI coding assistant. "
    "Condense the following version-control command output.",

    "- Keep: branch name, changed files, conflict markers, ahead/behind status, commit hashes.\n"
    "- Remove: verbose status messages, decorative lines, repeated blank lines.\n"
    "- Preserve error messages exactly.\n"
    "- Output must be shorter than the input.",

    "On branch main\n"
    "Your branch is ahead of 'origin/main' by 2 commits.\n"
    "  (use \"git push\" to publish your local commits)\n"
    "\n"
    "Changes not staged for commit:\n"
    "  (use \"git add <file>...\" to update what will be committed)\n"
    "        modified:   src/main.cpp",

    "branch: main (ahead 2)\n"
    "modified: src/main.cpp",
};

constexpr PromptTemplate FILE_OPERATIONS = {
    "You are a concise output condenser for an AI coding assistant. "
    "Condense the following file-operation command output.",

    "- Keep: file/directory paths, sizes, important metadata.\n"
    "- Remove: permissions, owner, group, timestamps unless specifically relevant.\n"
    "- Group items logically when possible.\n"
    "- Output must be shorter than the input.",

    "total 48\n"
    "drwxr-xr-x  5 user staff  160 Jan 10 14:23 src\n"
    "-rw-r--r--  1 user staff  842 Jan 10 14:20 CMakeLists.txt\n"
    "-rw-r--r--  1 user staff 1205 Jan 10 14:23 README.md",

    "src/ (dir)\n"
    "CMakeLists.txt (842B)\n"
    "README.md (1205B)",
};

constexpr PromptTemplate BUILD_TEST = {
    "You are a concise output condenser for an AI coding assistant. "
    "Condense the following build/test command output.",

    "- Keep: errors, warnings, test failures with file/line info, final summary.\n"
    "- Remove: passing-test output, progress indicators, download logs, per-target compile lines.\n"
    "- Preserve the exact text of error/warning messages.\n"
    "- Output must be shorter than the input.",

    "[ 10%] Building CXX object src/CMakeFiles/app.dir/util.cpp.o\n"
    "[ 20%] Building CXX object src/CMakeFiles/app.dir/main.cpp.o\n"
    "src/main.cpp:42:5: error: cannot convert 'const char*' to 'int' in return\n"
    "   42 |     return \"hello\";\n"
    "      |            ^~~~~~~\n"
    "make[2]: *** [src/CMakeFiles/app.dir/main.cpp.o] Error 1",

    "src/main.cpp:42:5: error: cannot convert 'const char*' to 'int' in return\n"
    "1 error",
};

constexpr PromptTemplate CONTAINER_TOOLS = {
    "You are a concise output condenser for an AI coding assistant. "
    "Condense the following container/orchestration command output.",

    "- Keep: container names, images, status, ports, error messages.\n"
    "- Remove: full container IDs, verbose labels, creation timestamps.\n"
    "- Format as a compact table or list.\n"
    "- Output must be shorter than the input.",

    "CONTAINER ID   IMAGE          COMMAND       CREATED        STATUS        PORTS"
    "                    NAMES\n"
    "a1b2c3d4e5f6   nginx:latest   \"nginx -g...\" 2 hours ago    Up 2 hours    "
    "0.0.0.0:80->80/tcp       web\n"
    "f6e5d4c3b2a1   redis:7        \"redis-se...\" 3 hours ago    Up 3 hours    "
    "0.0.0.0:6379->6379/tcp   cache",

    "web    nginx:latest  Up 2h  :80->80\n"
    "cache  redis:7       Up 3h  :6379->6379",
};

constexpr PromptTemplate LOGS = {
    "You are a concise output condenser for an AI coding assistant. "
    "Condense the following log output.",

    "- Keep: errors, warnings, unique messages, first/last occurrence of repeated patterns.\n"
    "- Remove: debug-level noise, duplicate lines, heartbeat/health-check entries.\n"
    "- Summarize repeated patterns with counts (e.g., \"request handled (x42)\").\n"
    "- Output must be shorter than the input.",

    "2024-01-10 14:00:01 INFO  Server started on :8080\n"
    "2024-01-10 14:00:02 DEBUG Request handled: GET /health\n"
    "2024-01-10 14:00:03 DEBUG Request handled: GET /health\n"
    "2024-01-10 14:00:04 DEBUG Request handled: GET /health\n"
    "2024-01-10 14:00:05 ERROR Connection refused: database at localhost:5432",

    "INFO  Server started on :8080\n"
    "DEBUG Request handled: GET /health (x3)\n"
    "ERROR Connection refused: database at localhost:5432",
};

constexpr PromptTemplate GENERIC = {
    "You are a concise output condenser for an AI coding assistant. "
    "Condense the following command output, preserving all critical information.",

    "- Keep: errors, warnings, key data, file paths, status indicators.\n"
    "- Remove: decorative lines, repeated blank lines, verbose progress output.\n"
    "- Preserve the semantic meaning of the output.\n"
    "- Output must be shorter than the input.",

    "==============================================\n"
    "  Processing complete!\n"
    "==============================================\n"
    "\n"
    "Results:\n"
    "  Files processed: 42\n"
    "  Errors: 1\n"
    "  Error in file.txt: line 10: invalid syntax\n"
    "\n"
    "Done.",

    "42 files processed, 1 error\n"
    "  file.txt:10: invalid syntax",
};

}  // namespace

const PromptTemplate& template_for(Category category) {
    switch (category) {
    case Category::VersionControl:
        return VERSION_CONTROL;
    case Category::FileOperations:
        return FILE_OPERATIONS;
    case Category::BuildTest:
        return BUILD_TEST;
    case Category::ContainerTools:
        return CONTAINER_TOOLS;
    case Category::Logs:
        return LOGS;
    case Category::Generic:
        return GENERIC;
    }
    return GENERIC;
}

std::string truncate_for_prompt(std::string_view text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return std::string(text);
    }
    size_t end = max_chars;
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    std::string out(text.substr(0, end));
    out += "\n[... " + std::to_string(text.size() - end) + " more characters truncated]";
    return out;
}

std::vector<ChatMessage> build_messages(std::string_view command, std::string_view output,
                                        Category category) {
    const PromptTemplate& t = template_for(category);

    std::string system = t.preamble;
    system += "\n\n## Rules\n";
    system += t.rules;
    system += "\n\n## Example\nBefore:\n```\n";
    system += t.example_before;
    system += "\n```\nAfter:\n```\n";
    system += t.example_after;
    system += "\n```\n\nReply with the condensed output only.";

    std::string user = "## Command\n`";
    user += command;
    user += "`\n\n## Raw output\n```\n";
    user += truncate_for_prompt(output);
    user += "\n```\n\n## Condensed output\n";

    return {ChatMessage{"system", std::move(system)}, ChatMessage{"user", std::move(user)}};
}

}  // namespace terse::llm
