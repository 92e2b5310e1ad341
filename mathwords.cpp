#include "mathwords.hpp"
#include "bootstrap_config.hpp"
#include "engine/plugin_engines.hpp"
#include "logger.hpp"

#ifndef MATHWORDS_VERSION
#define MATHWORDS_VERSION "0.1.0"
#endif

namespace mathwords {

namespace {

engine::DisplayMode toDisplayMode(bool displayMode) {
    return displayMode ? engine::DisplayMode::Block : engine::DisplayMode::Inline;
}

// Calls reacquire on scope exit, also when the wrapped call throws
class HostLockScope {
public:
    explicit HostLockScope(const HostLockHooks& hooks) : hooks_(hooks) {
        if (hooks_.release) hooks_.release();
    }
    ~HostLockScope() {
        if (hooks_.reacquire) hooks_.reacquire();
    }

    HostLockScope(const HostLockScope&) = delete;
    HostLockScope& operator=(const HostLockScope&) = delete;

private:
    HostLockHooks hooks_;
};

} // namespace

// =========================================================
// Verbalizer
// =========================================================
Verbalizer::Verbalizer(std::shared_ptr<engine::SpeechEngine> speech,
                       std::shared_ptr<engine::LatexEngine> latex,
                       Options options)
    : speech_(std::move(speech)),
      latex_(std::move(latex)),
      state_(sharedEngineState(speech_,
                               [rules = std::move(options.rules)](resources::RulesLocation& location,
                                                                  ErrorInfo* err) {
                                   return resources::resolveRulesDirectory(rules, location, err);
                               },
                               options.language)),
      pipeline_(state_->initializer, *speech_, *latex_,
                options.serializeConversions ? &state_->conversionMutex : nullptr),
      batch_(pipeline_) {}

void Verbalizer::setHostLockHooks(HostLockHooks hooks) {
    std::lock_guard<std::mutex> lock(hooksMutex_);
    hooks_ = std::move(hooks);
}

template <typename Fn>
bool Verbalizer::withHostLockReleased(Fn&& fn) {
    HostLockHooks hooks;
    {
        std::lock_guard<std::mutex> lock(hooksMutex_);
        hooks = hooks_;
    }
    HostLockScope scope(hooks);
    return std::forward<Fn>(fn)();
}

bool Verbalizer::tryVerbalize(const std::string& input, bool isMathML,
                              const std::string& speechStyle, bool displayMode,
                              std::string& text, ErrorInfo* err) {
    ConversionRequest request;
    request.input = input;
    request.kind = isMathML ? InputKind::MathML : InputKind::LaTeX;
    request.speechStyle = speechStyle;
    request.displayMode = toDisplayMode(displayMode);

    // Blank input never reaches the engine or the host hooks
    if (!validate(request, err)) return false;

    return withHostLockReleased([&] { return pipeline_.convert(request, text, err); });
}

bool Verbalizer::tryVerbalizeBatch(const std::vector<BatchItem>& items,
                                   const std::string& speechStyle, bool displayMode,
                                   std::vector<std::string>& results, ErrorInfo* err) {
    return withHostLockReleased([&] {
        return batch_.convertBatch(items, speechStyle, toDisplayMode(displayMode), results, err);
    });
}

std::string Verbalizer::verbalize(const std::string& input, bool isMathML,
                                  const std::string& speechStyle, bool displayMode) {
    std::string text;
    ErrorInfo err;
    if (!tryVerbalize(input, isMathML, speechStyle, displayMode, text, &err)) {
        ErrorManager::report(err);
        raise(err);
    }
    return text;
}

std::vector<std::string> Verbalizer::verbalizeBatch(const std::vector<BatchItem>& items,
                                                    const std::string& speechStyle,
                                                    bool displayMode) {
    std::vector<std::string> results;
    ErrorInfo err;
    if (!tryVerbalizeBatch(items, speechStyle, displayMode, results, &err)) {
        ErrorManager::report(err);
        raise(err);
    }
    return results;
}

// =========================================================
// Default instance
// =========================================================
Verbalizer& defaultVerbalizer() {
    static Verbalizer instance = [] {
        bootstrap_config::Settings settings = bootstrap_config::loadSettings();
        bootstrap_config::initAll(settings);

        Verbalizer::Options options;
        options.rules = resources::makeResolveOptions(settings.rules);
        options.language = settings.engine.language;
        options.serializeConversions = settings.engine.serializeConversions;

        return Verbalizer(engine::PluginSpeechEngine::shared(settings.engine.speechLibrary),
                          std::make_shared<engine::PluginLatexEngine>(settings.engine.latexLibrary),
                          std::move(options));
    }();
    return instance;
}

// =========================================================
// Public API
// =========================================================
std::string verbalize(const std::string& input, bool isMathML,
                      const std::string& speechStyle, bool displayMode) {
    return defaultVerbalizer().verbalize(input, isMathML, speechStyle, displayMode);
}

std::vector<std::string> verbalizeBatch(const std::vector<BatchItem>& items,
                                        const std::string& speechStyle, bool displayMode) {
    return defaultVerbalizer().verbalizeBatch(items, speechStyle, displayMode);
}

std::vector<std::string> listSpeechStyles() {
    return {"ClearSpeak", "SimpleSpeak"};
}

std::string version() {
    return MATHWORDS_VERSION;
}

std::string description() {
    return "Converts LaTeX and MathML expressions to spoken text";
}

} // namespace mathwords
