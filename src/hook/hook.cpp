// ==============================================================================
// hook.cpp - Протокол PreToolUse hook
// ==============================================================================

#include "terse/hook.hpp"

#include "terse/command.hpp"
#include "terse/platform.hpp"
#include "terse/text.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace terse::hook {

namespace {

constexpr size_t SUMMARY_MAX_CHARS = 200;

analytics::HookEvent make_event(const HookRequest& req, std::string decision,
                                std::optional<std::string> reason) {
    analytics::HookEvent ev;
    ev.timestamp = platform::now_rfc3339();
    ev.tool_name = req.tool_name;
    ev.command = req.command;
    ev.decision = std::move(decision);
    ev.reason = std::move(reason);
    return ev;
}

}  // namespace

bool HookRequest::is_bash() const {
    return text::iequals(tool_name, "bash");
}

ParseResult parse_request(std::string_view json) {
    ParseResult result;
    if (text::trim(json).empty()) {
        result.ok = true;
        return result;
    }

    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        result.error = std::string("invalid hook request JSON: ") +
                       rapidjson::GetParseError_En(doc.GetParseError()) + " (offset " +
                       std::to_string(doc.GetErrorOffset()) + ")";
        return result;
    }
    if (!doc.IsObject()) {
        result.error = "hook request is not a JSON object";
        return result;
    }

    auto tool = doc.FindMember("tool_name");
    if (tool != doc.MemberEnd() && tool->value.IsString()) {
        result.request.tool_name.assign(tool->value.GetString(), tool->value.GetStringLength());
    }
    auto input = doc.FindMember("tool_input");
    if (input != doc.MemberEnd() && input->value.IsObject()) {
        auto cmd = input->value.FindMember("command");
        if (cmd != input->value.MemberEnd() && cmd->value.IsString()) {
            result.request.command =
                std::string(cmd->value.GetString(), cmd->value.GetStringLength());
        }
    }
    result.ok = true;
    return result;
}

std::string escape_argument(std::string_view command) {
    std::string out;
    out.reserve(command.size() + 8);
    for (char c : command) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string build_rewrite_command(std::string_view exe, std::string_view command) {
    std::string out = "\"";
    out += exe;
    out += "\" run \"";
    out += escape_argument(command);
    out += '"';
    return out;
}

std::string rewrite_response(std::string_view rewritten, std::string_view reason) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> w(buffer);
    w.StartObject();
    w.Key("hookSpecificOutput");
    w.StartObject();
    w.Key("hookEventName");
    w.String("PreToolUse");
    w.Key("permissionDecision");
    w.String("allow");
    w.Key("permissionDecisionReason");
    w.String(reason.data(), static_cast<rapidjson::SizeType>(reason.size()));
    w.Key("updatedInput");
    w.StartObject();
    w.Key("command");
    w.String(rewritten.data(), static_cast<rapidjson::SizeType>(rewritten.size()));
    w.EndObject();
    w.EndObject();
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string summarize_command(std::string_view command) {
    std::string flat(command);
    for (char& c : flat) {
        if (c == '\r' || c == '\n') {
            c = ' ';
        }
    }
    return text::truncate_chars(flat, SUMMARY_MAX_CHARS);
}

HookOutcome handle(std::string_view input, router::Router& router, std::string_view exe) {
    HookOutcome out;
    out.response = EMPTY_RESPONSE;
    out.log.emplace_back("hook invoked");

    auto parsed = parse_request(input);
    if (!parsed) {
        out.log.push_back("hook error: " + parsed.error);
        return out;
    }
    const HookRequest& req = parsed.request;
    if (req.tool_name.empty() && !req.command) {
        return out;
    }

    out.log.push_back("request tool=" + req.tool_name + " command=\"" +
                      summarize_command(req.command.value_or("")) + "\"");

    if (!req.is_bash()) {
        out.event = make_event(req, "passthrough", std::string("unsupported tool"));
        return out;
    }
    if (!req.command || text::trim(*req.command).empty()) {
        out.event = make_event(req, "passthrough", std::string("no command"));
        return out;
    }

    const auto ctx = command::normalize(*req.command);
    const auto decision = router.decide_pre(ctx);
    if (!decision.rewrite) {
        const std::string reason = router::to_string(decision.reason);
        out.log.push_back("router decided passthrough (" + reason + ")");
        out.event = make_event(req, "passthrough", reason);
        return out;
    }

    const std::string rewritten = build_rewrite_command(exe, *req.command);
    const std::string reason =
        "terse: optimizing output (" + router::to_string(decision.expected_path) + " path)";
    out.log.push_back("router decided rewrite; command: " + rewritten);
    out.event = make_event(req, "rewrite", std::nullopt);
    out.response = rewrite_response(rewritten, reason);
    return out;
}

std::optional<std::filesystem::path> default_log_path() {
    auto dir = platform::state_dir();
    if (!dir) {
        return std::nullopt;
    }
    return *dir / HOOK_LOG_FILE;
}

analytics::AppendResult append_log(const std::filesystem::path& file, std::string_view message) {
    analytics::AppendResult result;
    std::string line = platform::now_rfc3339();
    line += ' ';
    line += message;
    if (!platform::append_line(file, line)) {
        result.error = "failed to append to " + platform::path_to_utf8(file);
        return result;
    }
    result.ok = true;
    return result;
}

}  // namespace terse::hook
