#include "commands/commands_core.hpp"
#include "logger.hpp"
#include "mathwords.hpp"

#include <iostream>
#include <string>
#include <vector>

static void printResult(const CommandResult& result) {
    (result.success ? std::cout : std::cerr) << result.message << std::endl;
}

static void printUsage() {
    std::cout << "Usage: mathwords_cli [--style S] [--display] [--mathml] [expression]\n"
              << "Without an expression, starts an interactive session.\n";
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    // 🔹 Parse flags
    CliOptions options;
    std::string err;
    if (!parseArguments(std::vector<std::string>(argv + 1, argv + argc), options, &err)) {
        std::cerr << err << "\n";
        printUsage();
        return 1;
    }
    if (options.showHelp) {
        printUsage();
        return 0;
    }
    if (!options.speechStyle.empty()) commandSession().speechStyle = options.speechStyle;
    if (options.displayMode) commandSession().displayMode = true;

    const std::string& expression = options.expression;

    // Configure logging and the default engines before the first command
    mathwords::defaultVerbalizer();
    LOG_PHASE("Startup complete", true);

    // ============================================================
    // One-shot mode
    // ============================================================
    if (!expression.empty()) {
        CommandResult result = options.isMathML ? cmdMathML(expression) : cmdSay(expression);
        printResult(result);
        shutdownLogger();
        return result.success ? 0 : 1;
    }

    // ============================================================
    // Console REPL loop
    // ============================================================
    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }

        if (mathwords::isBlank(line)) {
            continue;
        }

        if (line == "quit" || line == "exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }

        LOG_TRACE("Console", "Dispatching command: " + line);
        printResult(handleCommand(line));
    }

    LOG_PHASE("Shutdown complete", true);
    shutdownLogger();
    return 0;
}
