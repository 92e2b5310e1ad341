#include "commands_core.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>

using mathwords::ErrorManager::getUserMessage;

// ------------------------------------------------------------
// Globals
// ------------------------------------------------------------
std::unordered_map<std::string, CommandFunc> commandMap;

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \n\r\t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \n\r\t");
    return s.substr(start, end - start + 1);
}

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

// ------------------------------------------------------------
// Command Registration
// ------------------------------------------------------------
static void initCommands() {
    if (!commandMap.empty()) return; // already initialized

    commandMap = {
        // --- Conversion ---
        {"say",      cmdSay},
        {"mathml",   cmdMathML},
        {"batch",    cmdBatch},

        // --- Session ---
        {"style",    cmdStyle},
        {"display",  cmdDisplay},
        {"styles",   cmdListStyles},

        // --- Info ---
        {"version",  cmdVersion},
        {"help",     cmdShowHelp}
    };
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input) {
    std::string line = trim(input);
    auto pos = line.find(' ');
    if (pos == std::string::npos) {
        return {line, ""};
    }
    return {line.substr(0, pos), trim(line.substr(pos + 1))};
}

CommandResult dispatchCommand(const std::string& cmd, const std::string& arg) {
    initCommands();

    auto it = commandMap.find(cmd);
    if (it != commandMap.end()) {
        LOG_TRACE("Dispatch", "Found handler for cmd=\"" + cmd + "\" arg=\"" + arg + "\"");
        try {
            return it->second(arg);
        } catch (const std::exception& e) {
            LOG_ERROR("Dispatch", "Exception in command \"" + cmd + "\": " + e.what());
            return {
                "[Error] Exception while running command: " + cmd,
                false,
                "ERR_ENGINE_PANIC"
            };
        }
    }

    LOG_TRACE("Dispatch", "Unknown command: \"" + cmd + "\"");
    return {
        getUserMessage("ERR_CLI_UNKNOWN_COMMAND") + ": " + cmd,
        false,
        "ERR_CLI_UNKNOWN_COMMAND"
    };
}

// ------------------------------------------------------------
// handleCommand: command lookup, else verbalize the line
// ------------------------------------------------------------
CommandResult handleCommand(const std::string& line) {
    auto [cmdRaw, arg] = parseInput(line);
    std::string cmd = toLower(cmdRaw);

    initCommands();

    CommandResult result;
    if (commandMap.contains(cmd)) {
        result = dispatchCommand(cmd, arg);
    } else {
        // 🔹 Not a command: treat the whole line as a LaTeX expression
        result = cmdSay(trim(line));
    }

    if (result.message.empty()) {
        result.message = "[no response]";
        result.success = false;
        if (result.errorCode.empty()) result.errorCode = "ERR_NONE";
    }

    LOG_TRACE("Console", "[" + result.errorCode + "] " + (result.success ? "ok" : "failed"));
    return result;
}

// ------------------------------------------------------------
// parseArguments: CLI flags, everything else is the expression
// ------------------------------------------------------------
bool parseArguments(const std::vector<std::string>& args, CliOptions& out, std::string* err) {
    CliOptions opts;
    for (std::size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--style") {
            if (i + 1 >= args.size()) {
                if (err) *err = "--style requires a value";
                LOG_ERROR("Console", "--style requires a value");
                return false;
            }
            opts.speechStyle = args[++i];
        } else if (arg == "--display") {
            opts.displayMode = true;
        } else if (arg == "--mathml") {
            opts.isMathML = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
        } else {
            if (!opts.expression.empty()) opts.expression += " ";
            opts.expression += arg;
        }
    }
    out = std::move(opts);
    return true;
}
