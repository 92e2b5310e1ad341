#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// ------------------------------------------------------------
// CommandResult: unified return type for all commands
// ------------------------------------------------------------
struct CommandResult {
    std::string message;    // user-facing text
    bool success = true;    // true if command succeeded
    std::string errorCode;  // error code for ErrorManager/Logger ("ERR_NONE" on success)
};

// ------------------------------------------------------------
// Function pointer type for commands
// ------------------------------------------------------------
using CommandFunc = CommandResult(*)(const std::string& arg);

extern std::unordered_map<std::string, CommandFunc> commandMap;

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input);
CommandResult dispatchCommand(const std::string& cmd, const std::string& arg);

// Runs one REPL line. Unknown commands are verbalized as LaTeX.
CommandResult handleCommand(const std::string& line);

// ------------------------------------------------------------
// Command line of the CLI: [--style S] [--display] [--mathml] [expression]
// ------------------------------------------------------------
struct CliOptions {
    std::string expression;    // remaining words joined by spaces
    std::string speechStyle;   // empty = keep the session default
    bool displayMode = false;
    bool isMathML = false;
    bool showHelp = false;
};

// args excludes the program name. False (with err set) when a flag is
// missing its value.
bool parseArguments(const std::vector<std::string>& args, CliOptions& out, std::string* err);

#include "commands_verbalize.hpp"
