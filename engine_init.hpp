#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include "engine/speech_engine.hpp"
#include "error_manager.hpp"
#include "resources.hpp"

namespace mathwords {

enum class EngineStatus {
    Uninitialized,
    Initializing,
    Ready
};

const char* toString(EngineStatus status);

// Locks a deferred unique_lock. A std::system_error from the mutex becomes
// an Initialization error (ERR_ENGINE_INIT).
template <typename Mutex>
bool acquireLock(std::unique_lock<Mutex>& lock, const std::string& what, ErrorInfo* err) {
    try {
        lock.lock();
        return true;
    } catch (const std::system_error& e) {
        if (err) *err = makeError(ErrorKind::Initialization, "ERR_ENGINE_INIT",
                                  "Failed to acquire " + what + ": " + e.what());
        return false;
    }
}

// ------------------------------------------------------------
// EngineInitializer
//
// Owns the configuration state of one SpeechEngine. The first successful
// ensureReady() sets the rules directory, language and speech style; every
// later call only updates the speech style. The state mutex is held for
// the whole call.
// ------------------------------------------------------------
class EngineInitializer {
public:
    using RulesLocator = std::function<bool(resources::RulesLocation&, ErrorInfo*)>;

    EngineInitializer(engine::SpeechEngine& engine,
                      RulesLocator locator,
                      std::string language = "en");

    EngineInitializer(const EngineInitializer&) = delete;
    EngineInitializer& operator=(const EngineInitializer&) = delete;

    bool ensureReady(const std::string& speechStyle, ErrorInfo* err);

    EngineStatus status() const;
    bool isReady() const { return status() == EngineStatus::Ready; }

    std::size_t fullInitializations() const;
    std::size_t styleUpdates() const;
    std::optional<resources::RulesLocation> rulesLocation() const;

private:
    bool initialize(const std::string& speechStyle, ErrorInfo* err);
    bool updateStyle(const std::string& speechStyle, ErrorInfo* err);

    engine::SpeechEngine& engine_;
    RulesLocator locator_;
    std::string language_;

    mutable std::mutex mutex_;
    EngineStatus status_ = EngineStatus::Uninitialized;
    std::optional<resources::RulesLocation> location_;
    std::size_t fullInits_ = 0;
    std::size_t styleUpdates_ = 0;
};

// ------------------------------------------------------------
// SharedEngineState: the process-wide state of one speech engine
//
// sharedEngineState() returns the same state for the same engine for the
// rest of the process, so an engine is initialized at most once however
// many Verbalizers use it. The locator and language of the first caller
// are the ones kept.
// ------------------------------------------------------------
struct SharedEngineState {
    SharedEngineState(std::shared_ptr<engine::SpeechEngine> engine,
                      EngineInitializer::RulesLocator locator,
                      std::string language);

    SharedEngineState(const SharedEngineState&) = delete;
    SharedEngineState& operator=(const SharedEngineState&) = delete;

    std::shared_ptr<engine::SpeechEngine> speech;
    EngineInitializer initializer;
    std::mutex conversionMutex;   // serializes conversions on this engine
};

std::shared_ptr<SharedEngineState> sharedEngineState(std::shared_ptr<engine::SpeechEngine> speech,
                                                     EngineInitializer::RulesLocator locator,
                                                     std::string language);

} // namespace mathwords
