#include "commands_core.hpp"
#include "commands_verbalize.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "mathwords.hpp"

#include <fstream>
#include <sstream>

using mathwords::BatchItem;
using mathwords::ErrorInfo;
using mathwords::Verbalizer;
namespace ErrorManager = mathwords::ErrorManager;

// ------------------------------------------------------------
// Session
// ------------------------------------------------------------
static CommandSession g_session;
static Verbalizer* g_verbalizer = nullptr;

CommandSession& commandSession() {
    return g_session;
}

void setCommandVerbalizer(Verbalizer* verbalizer) {
    g_verbalizer = verbalizer;
}

static Verbalizer& verbalizer() {
    return g_verbalizer ? *g_verbalizer : mathwords::defaultVerbalizer();
}

static CommandResult failure(const ErrorInfo& err) {
    ErrorManager::report(err);
    return {
        ErrorManager::getUserMessage(err.code) + "\n" + err.describe(),
        false,
        err.code
    };
}

static CommandResult convertOne(const std::string& input, bool isMathML) {
    std::string text;
    ErrorInfo err;
    if (!verbalizer().tryVerbalize(input, isMathML, g_session.speechStyle,
                                   g_session.displayMode, text, &err)) {
        return failure(err);
    }
    return {text, true, "ERR_NONE"};
}

// ------------------------------------------------------------
// [Convert] LaTeX / MathML
// ------------------------------------------------------------
CommandResult cmdSay(const std::string& arg) {
    return convertOne(arg, false);
}

CommandResult cmdMathML(const std::string& arg) {
    return convertOne(arg, true);
}

// ------------------------------------------------------------
// [Convert] One LaTeX expression per line of a file
// ------------------------------------------------------------
CommandResult cmdBatch(const std::string& arg) {
    if (arg.empty()) {
        return {ErrorManager::getUserMessage("ERR_CLI_BATCH_FILE"), false, "ERR_CLI_BATCH_FILE"};
    }

    std::ifstream in(arg);
    if (!in) {
        LOG_ERROR("Batch", "Could not open " + arg);
        return {ErrorManager::getUserMessage("ERR_CLI_BATCH_FILE") + " (" + arg + ")", false, "ERR_CLI_BATCH_FILE"};
    }

    std::vector<BatchItem> items;
    std::string line;
    while (std::getline(in, line)) {
        if (mathwords::isBlank(line)) continue;
        items.push_back({line, std::nullopt});
    }

    std::vector<std::string> results;
    ErrorInfo err;
    if (!verbalizer().tryVerbalizeBatch(items, g_session.speechStyle,
                                        g_session.displayMode, results, &err)) {
        return failure(err);
    }

    std::ostringstream out;
    for (std::size_t i = 0; i < results.size(); i++) {
        if (i) out << "\n";
        out << (i + 1) << ". " << results[i];
    }
    return {out.str(), true, "ERR_NONE"};
}

// ------------------------------------------------------------
// [Session] Speech style and display mode
// ------------------------------------------------------------
CommandResult cmdStyle(const std::string& arg) {
    if (arg.empty()) {
        return {"[Style] " + g_session.speechStyle, true, "ERR_NONE"};
    }
    // Forwarded verbatim; the engine rejects unknown styles on the next conversion
    g_session.speechStyle = arg;
    return {"[Style] Speech style set to " + arg, true, "ERR_NONE"};
}

CommandResult cmdDisplay(const std::string& arg) {
    if (arg == "on" || arg == "block") {
        g_session.displayMode = true;
    } else if (arg == "off" || arg == "inline") {
        g_session.displayMode = false;
    } else if (!arg.empty()) {
        return {"[Display] Usage: display on|off", false, "ERR_CLI_UNKNOWN_COMMAND"};
    }
    return {std::string("[Display] ") + (g_session.displayMode ? "block" : "inline"), true, "ERR_NONE"};
}

CommandResult cmdListStyles([[maybe_unused]] const std::string& arg) {
    std::string text = "[Styles]";
    for (const auto& style : mathwords::listSpeechStyles()) {
        text += "\n- " + style;
    }
    return {text, true, "ERR_NONE"};
}

// ------------------------------------------------------------
// [Info]
// ------------------------------------------------------------
CommandResult cmdVersion([[maybe_unused]] const std::string& arg) {
    return {"mathwords " + mathwords::version() + " - " + mathwords::description(), true, "ERR_NONE"};
}

CommandResult cmdShowHelp([[maybe_unused]] const std::string& arg) {
    std::string helpText =
        "[Help] Available commands:\n"
        "- say <latex>\n"
        "- mathml <markup>\n"
        "- batch <file>\n"
        "- style [name]\n"
        "- display on|off\n"
        "- styles\n"
        "- version\n"
        "- help\n"
        "- quit / exit\n"
        "Any other line is read as LaTeX.";

    return {helpText, true, "ERR_NONE"};
}
