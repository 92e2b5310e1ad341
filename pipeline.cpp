#include "pipeline.hpp"
#include "engine/engine_guard.hpp"
#include "logger.hpp"

#include <cctype>
#include <memory>

namespace mathwords {

using engine::guardedCall;

bool isBlank(const std::string& text) {
    for (unsigned char c : text) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

bool validate(const ConversionRequest& request, ErrorInfo* err) {
    if (isBlank(request.input)) {
        if (err) *err = makeError(ErrorKind::Validation, "ERR_EMPTY_INPUT", "Input cannot be empty");
        return false;
    }
    return true;
}

ConversionPipeline::ConversionPipeline(EngineInitializer& initializer,
                                       engine::SpeechEngine& speech,
                                       engine::LatexEngine& latex,
                                       std::mutex* conversionLock)
    : initializer_(initializer),
      speech_(speech),
      latex_(latex),
      conversionLock_(conversionLock) {}

bool ConversionPipeline::convert(const ConversionRequest& request, std::string& text, ErrorInfo* err) {
    if (!validate(request, err)) return false;

    std::unique_lock<std::mutex> lock;
    if (conversionLock_) {
        lock = std::unique_lock<std::mutex>(*conversionLock_, std::defer_lock);
        if (!acquireLock(lock, "conversion lock", err)) return false;
    }

    if (!initializer_.ensureReady(request.speechStyle, err)) return false;
    return render(request, text, err);
}

bool ConversionPipeline::render(const ConversionRequest& request, std::string& text, ErrorInfo* err) {
    if (request.kind == InputKind::MathML) {
        return mathmlToSpeech(request.input, text, err);
    }

    std::string mathml;
    if (!latexToMathML(request.input, request.displayMode, mathml, err)) return false;
    return mathmlToSpeech(mathml, text, err);
}

bool ConversionPipeline::latexToMathML(const std::string& latex, engine::DisplayMode mode,
                                       std::string& mathml, ErrorInfo* err) {
    std::unique_ptr<engine::LatexConverter> converter;
    bool ok = guardedCall(
        {"LatexToMathML", "Failed to create LaTeX converter", ErrorKind::LatexConversion, "ERR_LATEX_CONVERSION"},
        [&](std::string* detail) {
            converter = latex_.create(engine::LatexConfig{}, detail);
            return converter != nullptr;
        },
        err);
    if (!ok) return false;

    std::string out;
    ok = guardedCall(
        {"LatexToMathML", "LaTeX conversion failed", ErrorKind::LatexConversion, "ERR_LATEX_CONVERSION"},
        [&](std::string* detail) { return converter->convert(latex, mode, out, detail); },
        err);
    if (!ok) return false;

    LOG_TRACE("Pipeline", latex + " -> " + out);
    mathml = std::move(out);
    return true;
}

bool ConversionPipeline::mathmlToSpeech(const std::string& mathml, std::string& text, ErrorInfo* err) {
    bool ok = guardedCall(
        {"SetMathML", "Failed to set MathML", ErrorKind::MathMLConversion, "ERR_MATHML_CONVERSION"},
        [&](std::string* detail) { return speech_.setMathML(mathml, detail); },
        err);
    if (!ok) return false;

    std::string spoken;
    ok = guardedCall(
        {"GetSpokenText", "Failed to get spoken text", ErrorKind::MathMLConversion, "ERR_MATHML_CONVERSION"},
        [&](std::string* detail) { return speech_.getSpokenText(spoken, detail); },
        err);
    if (!ok) return false;

    text = std::move(spoken);
    return true;
}

} // namespace mathwords
