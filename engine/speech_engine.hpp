#pragma once
#include <string>

namespace mathwords::engine {

// ------------------------------------------------------------
// SpeechEngine: MathML -> spoken text rules engine.
//
// The engine is a single configured instance: rules directory and
// preferences are process-visible state, and SetMathML/GetSpokenText
// share "currently loaded markup". Implementations report ordinary
// failures through the return value and *err; anything they throw is
// treated as an internal crash by the engine guard.
// ------------------------------------------------------------
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;

    virtual bool setRulesDir(const std::string& path, std::string* err) = 0;

    // Known names: "Language", "SpeechStyle"
    virtual bool setPreference(const std::string& name,
                               const std::string& value,
                               std::string* err) = 0;

    virtual bool setMathML(const std::string& mathml, std::string* err) = 0;

    // Speech for the markup loaded by the last setMathML()
    virtual bool getSpokenText(std::string& text, std::string* err) = 0;
};

} // namespace mathwords::engine
