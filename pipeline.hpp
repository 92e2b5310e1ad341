#pragma once
#include <mutex>
#include <string>

#include "engine/latex_converter.hpp"
#include "engine/speech_engine.hpp"
#include "engine_init.hpp"
#include "error_manager.hpp"

namespace mathwords {

enum class InputKind {
    LaTeX,
    MathML
};

struct ConversionRequest {
    std::string input;
    InputKind kind = InputKind::LaTeX;
    std::string speechStyle = "ClearSpeak";
    engine::DisplayMode displayMode = engine::DisplayMode::Inline;
};

// True for empty or whitespace-only text
bool isBlank(const std::string& text);

// ERR_EMPTY_INPUT for blank input, no engine interaction
bool validate(const ConversionRequest& request, ErrorInfo* err);

// ------------------------------------------------------------
// ConversionPipeline: one request -> spoken text
// ------------------------------------------------------------
class ConversionPipeline {
public:
    // conversionLock may be null; otherwise it is held around each convert()
    ConversionPipeline(EngineInitializer& initializer,
                       engine::SpeechEngine& speech,
                       engine::LatexEngine& latex,
                       std::mutex* conversionLock = nullptr);

    // validate, ensureReady, render
    bool convert(const ConversionRequest& request, std::string& text, ErrorInfo* err);

    // Steps after initialization. Caller holds conversionLock() if any.
    bool render(const ConversionRequest& request, std::string& text, ErrorInfo* err);

    bool latexToMathML(const std::string& latex, engine::DisplayMode mode,
                       std::string& mathml, ErrorInfo* err);
    bool mathmlToSpeech(const std::string& mathml, std::string& text, ErrorInfo* err);

    EngineInitializer& initializer() { return initializer_; }
    std::mutex* conversionLock() const { return conversionLock_; }

private:
    EngineInitializer& initializer_;
    engine::SpeechEngine& speech_;
    engine::LatexEngine& latex_;
    std::mutex* conversionLock_;
};

} // namespace mathwords
