#pragma once
#include <string>

namespace mathwords { class Verbalizer; }

struct CommandResult;

// ------------------------------------------------------------
// Session state shared by the conversion commands
// ------------------------------------------------------------
struct CommandSession {
    std::string speechStyle = "ClearSpeak";
    bool displayMode = false;
};

CommandSession& commandSession();

// Verbalizer used by the commands. nullptr restores defaultVerbalizer().
void setCommandVerbalizer(mathwords::Verbalizer* verbalizer);

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------
CommandResult cmdSay(const std::string& arg);         // say <latex>
CommandResult cmdMathML(const std::string& arg);      // mathml <markup>
CommandResult cmdBatch(const std::string& arg);       // batch <file>
CommandResult cmdStyle(const std::string& arg);       // style [name]
CommandResult cmdDisplay(const std::string& arg);     // display on|off
CommandResult cmdListStyles(const std::string& arg);  // styles
CommandResult cmdVersion(const std::string& arg);     // version
CommandResult cmdShowHelp(const std::string& arg);    // help
