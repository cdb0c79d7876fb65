// ==============================================================================
// cli.cpp - Разбор командной строки
// ==============================================================================

#include "terse/cli.hpp"

namespace terse::cli {

namespace {

bool is_help_flag(const std::string& arg) {
    return arg == "-h" || arg == "--help";
}

std::string render_usage_error(const std::string& error_msg, const std::string& usage) {
    return error_msg + "\n\nUsage: " + usage + "\n\nFor more information, try '--help'.\n";
}

ParseResult usage_error(ParseResult result, const std::string& message, const std::string& usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error("error: " + message, usage);
    return result;
}

/// Аргументы после подкоманды в одну строку команды
std::string join_command(const std::vector<std::string>& args, size_t from) {
    std::string out;
    for (size_t i = from; i < args.size(); ++i) {
        if (!out.empty()) {
            out += ' ';
        }
        out += args[i];
    }
    return out;
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("terse ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: terse [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  hook    Handle a PreToolUse hook request (JSON on stdin)\n"
               "  run     Run a command and print its optimized output\n"
               "  check   Preview routing decisions and the optimized output of a command\n"
               "  health  Show circuit breaker and smart path status\n"
               "  stats   Show token savings statistics\n"
               "  config  Show or initialize the configuration\n"
               "  help    Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "  -v...          Print verbose output\n"
               "  -q             Suppress informational output\n"
               "  -h, --help     Print help\n"
               "  -V, --version  Print version\n";
    }
    if (*command == "run") {
        return "Run a command and print its optimized output\n"
               "\n"
               "Usage: terse run <COMMAND>...\n"
               "\n"
               "Arguments:\n"
               "  <COMMAND>...  Command line to execute through `sh -c`\n"
               "\n"
               "The exit status of terse is the exit status of the command.\n";
    }
    if (*command == "check") {
        return "Preview routing decisions and the optimized output of a command\n"
               "\n"
               "Usage: terse check <COMMAND>...\n"
               "\n"
               "Arguments:\n"
               "  <COMMAND>...  Command line to execute through `sh -c`\n";
    }
    if (*command == "hook") {
        return "Handle a PreToolUse hook request (JSON on stdin)\n"
               "\n"
               "Usage: terse hook\n";
    }
    if (*command == "health") {
        return "Show circuit breaker and smart path status\n"
               "\n"
               "Usage: terse health [OPTIONS]\n"
               "\n"
               "Options:\n"
               "      --json  Output as JSON\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "stats") {
        return "Show token savings statistics\n"
               "\n"
               "Usage: terse stats [OPTIONS]\n"
               "\n"
               "Options:\n"
               "      --json  Output as JSON\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "config") {
        return "Show or initialize the configuration\n"
               "\n"
               "Usage: terse config <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  show  Print the resolved configuration as YAML\n"
               "  init  Write the default configuration file\n"
               "\n"
               "Options:\n"
               "      --force  Overwrite an existing file (init)\n"
               "  -h, --help   Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

ParseResult parse(const std::vector<std::string>& args) {
    ParseResult result;
    result.command = HelpCommand{};

    if (args.empty()) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    size_t cmd_idx = args.size();
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-v") {
            result.global.verbose++;
        } else if (arg == "-vv") {
            result.global.verbose += 2;
        } else if (arg == "-q") {
            result.global.quiet = true;
        } else if (is_help_flag(arg)) {
            result.ok = true;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (!arg.empty() && arg[0] == '-') {
            return usage_error(result, "unexpected argument '" + arg + "' found",
                               "terse [OPTIONS] <COMMAND>");
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= args.size()) {
        result.ok = true;
        return result;
    }

    const std::string& cmd = args[cmd_idx];
    const size_t rest = cmd_idx + 1;

    if (cmd == "run" || cmd == "check") {
        // Все аргументы после подкоманды принадлежат целевой команде
        const std::string line = join_command(args, rest);
        if (line.empty()) {
            return usage_error(result,
                               "the following required arguments were not provided:\n  <COMMAND>",
                               "terse " + cmd + " <COMMAND>...");
        }
        if (rest + 1 == args.size() && is_help_flag(args[rest])) {
            result.ok = true;
            result.command = HelpCommand{cmd};
            return result;
        }
        result.ok = true;
        if (cmd == "run") {
            result.command = RunCommand{line};
        } else {
            result.command = CheckCommand{line};
        }
        return result;
    }

    if (cmd == "hook") {
        for (size_t i = rest; i < args.size(); ++i) {
            if (is_help_flag(args[i])) {
                result.ok = true;
                result.command = HelpCommand{cmd};
                return result;
            }
        }
        result.ok = true;
        result.command = HookCommand{};
        return result;
    }

    if (cmd == "health" || cmd == "stats") {
        bool json = false;
        for (size_t i = rest; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (is_help_flag(arg)) {
                result.ok = true;
                result.command = HelpCommand{cmd};
                return result;
            }
            if (arg == "--json") {
                json = true;
            } else if (arg == "-v") {
                result.global.verbose++;
            } else if (arg == "-q") {
                result.global.quiet = true;
            } else {
                return usage_error(result, "unexpected argument '" + arg + "' found",
                                   "terse " + cmd + " [OPTIONS]");
            }
        }
        result.ok = true;
        if (cmd == "health") {
            result.command = HealthCommand{json};
        } else {
            result.command = StatsCommand{json};
        }
        return result;
    }

    if (cmd == "config") {
        if (rest >= args.size()) {
            return usage_error(result, "'terse config' requires a subcommand",
                               "terse config <COMMAND>");
        }
        const std::string& sub = args[rest];
        if (is_help_flag(sub)) {
            result.ok = true;
            result.command = HelpCommand{cmd};
            return result;
        }
        bool force = false;
        for (size_t i = rest + 1; i < args.size(); ++i) {
            if (args[i] == "--force" && sub == "init") {
                force = true;
            } else if (is_help_flag(args[i])) {
                result.ok = true;
                result.command = HelpCommand{cmd};
                return result;
            } else {
                return usage_error(result, "unexpected argument '" + args[i] + "' found",
                                   "terse config <COMMAND>");
            }
        }
        if (sub == "show") {
            result.ok = true;
            result.command = ConfigShowCommand{};
            return result;
        }
        if (sub == "init") {
            result.ok = true;
            result.command = ConfigInitCommand{force};
            return result;
        }
        return usage_error(result, "unrecognized subcommand '" + sub + "'",
                           "terse config <COMMAND>");
    }

    if (cmd == "help") {
        result.ok = true;
        if (rest < args.size()) {
            result.command = HelpCommand{args[rest]};
        }
        return result;
    }

    return usage_error(result, "unrecognized subcommand '" + cmd + "'",
                       "terse [OPTIONS] <COMMAND>");
}

}  // namespace terse::cli
