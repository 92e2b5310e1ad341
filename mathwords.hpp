#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "batch.hpp"
#include "engine/latex_converter.hpp"
#include "engine/speech_engine.hpp"
#include "engine_init.hpp"
#include "error_manager.hpp"
#include "pipeline.hpp"
#include "resources.hpp"

namespace mathwords {

// ------------------------------------------------------------
// Host interop: called around the conversion work of every public call
// ------------------------------------------------------------
struct HostLockHooks {
    std::function<void()> release;     // before conversion work
    std::function<void()> reacquire;   // before returning to the host
};

// ------------------------------------------------------------
// Verbalizer: pipeline and batcher over one engine set
//
// The engine state (initializer and conversion lock) is shared by every
// Verbalizer built on the same SpeechEngine; see sharedEngineState().
// ------------------------------------------------------------
class Verbalizer {
public:
    struct Options {
        resources::ResolveOptions rules;
        std::string language = "en";
        bool serializeConversions = true;
    };

    Verbalizer(std::shared_ptr<engine::SpeechEngine> speech,
               std::shared_ptr<engine::LatexEngine> latex,
               Options options);

    Verbalizer(const Verbalizer&) = delete;
    Verbalizer& operator=(const Verbalizer&) = delete;

    // Throw ValidationError / ConversionError
    std::string verbalize(const std::string& input,
                          bool isMathML = false,
                          const std::string& speechStyle = "ClearSpeak",
                          bool displayMode = false);

    std::vector<std::string> verbalizeBatch(const std::vector<BatchItem>& items,
                                            const std::string& speechStyle = "ClearSpeak",
                                            bool displayMode = false);

    // Non-throwing forms
    bool tryVerbalize(const std::string& input, bool isMathML,
                      const std::string& speechStyle, bool displayMode,
                      std::string& text, ErrorInfo* err);

    bool tryVerbalizeBatch(const std::vector<BatchItem>& items,
                           const std::string& speechStyle, bool displayMode,
                           std::vector<std::string>& results, ErrorInfo* err);

    void setHostLockHooks(HostLockHooks hooks);

    EngineInitializer& initializer() { return state_->initializer; }

private:
    template <typename Fn>
    bool withHostLockReleased(Fn&& fn);

    std::shared_ptr<engine::SpeechEngine> speech_;
    std::shared_ptr<engine::LatexEngine> latex_;
    std::shared_ptr<SharedEngineState> state_;

    ConversionPipeline pipeline_;
    BatchCoordinator batch_;

    std::mutex hooksMutex_;
    HostLockHooks hooks_;
};

// Process-wide instance configured from MATHWORDS_CONFIG, using the plugin engines
Verbalizer& defaultVerbalizer();

// ------------------------------------------------------------
// Public API (backed by defaultVerbalizer())
// ------------------------------------------------------------
std::string verbalize(const std::string& input,
                      bool isMathML = false,
                      const std::string& speechStyle = "ClearSpeak",
                      bool displayMode = false);

std::vector<std::string> verbalizeBatch(const std::vector<BatchItem>& items,
                                        const std::string& speechStyle = "ClearSpeak",
                                        bool displayMode = false);

// Fixed list, independent of the engine
std::vector<std::string> listSpeechStyles();

std::string version();
std::string description();

} // namespace mathwords
