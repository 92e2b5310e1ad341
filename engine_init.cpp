#include "engine_init.hpp"
#include "engine/engine_guard.hpp"
#include "logger.hpp"

#include <map>

namespace mathwords {

using engine::EngineCall;
using engine::guardedCall;

const char* toString(EngineStatus status) {
    switch (status) {
        case EngineStatus::Uninitialized: return "uninitialized";
        case EngineStatus::Initializing:  return "initializing";
        case EngineStatus::Ready:         return "ready";
    }
    return "unknown";
}

EngineInitializer::EngineInitializer(engine::SpeechEngine& engine,
                                     RulesLocator locator,
                                     std::string language)
    : engine_(engine),
      locator_(std::move(locator)),
      language_(std::move(language)) {}

bool EngineInitializer::ensureReady(const std::string& speechStyle, ErrorInfo* err) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!acquireLock(lock, "engine state lock", err)) {
        LOG_ERROR("Engine", err ? err->message : "Failed to acquire engine state lock");
        return false;
    }

    if (status_ == EngineStatus::Ready) {
        return updateStyle(speechStyle, err);
    }

    status_ = EngineStatus::Initializing;
    beginPhaseGroup();
    bool ok = initialize(speechStyle, err);
    endPhaseGroup();

    status_ = ok ? EngineStatus::Ready : EngineStatus::Uninitialized;
    return ok;
}

bool EngineInitializer::initialize(const std::string& speechStyle, ErrorInfo* err) {
    resources::RulesLocation location;
    if (!locator_) {
        if (err) *err = makeError(ErrorKind::Resource, "ERR_RULES_RESOURCE", "No rules locator configured");
        LOG_PHASE("Engine initialization", false);
        return false;
    }
    if (!locator_(location, err)) {
        LOG_PHASE("Rules directory resolved", false);
        return false;
    }
    LOG_PHASE(std::string("Rules directory resolved (") + resources::toString(location.source) + ")", true);

    const std::string rulesDir = location.path.string();
    bool ok = guardedCall(
        {"SetRulesDir", "Failed to set rules directory", ErrorKind::Initialization, "ERR_ENGINE_INIT"},
        [&](std::string* detail) { return engine_.setRulesDir(rulesDir, detail); },
        err);
    LOG_PHASE("SetRulesDir " + rulesDir, ok);
    if (!ok) return false;

    ok = guardedCall(
        {"SetPreference", "Failed to set language", ErrorKind::Initialization, "ERR_ENGINE_INIT"},
        [&](std::string* detail) { return engine_.setPreference("Language", language_, detail); },
        err);
    LOG_PHASE("Language=" + language_, ok);
    if (!ok) return false;

    ok = guardedCall(
        {"SetPreference", "Failed to set speech style", ErrorKind::Initialization, "ERR_ENGINE_INIT"},
        [&](std::string* detail) { return engine_.setPreference("SpeechStyle", speechStyle, detail); },
        err);
    LOG_PHASE("SpeechStyle=" + speechStyle, ok);
    if (!ok) return false;

    location_ = location;
    fullInits_++;
    LOG_PHASE("Engine initialization", true);
    return true;
}

bool EngineInitializer::updateStyle(const std::string& speechStyle, ErrorInfo* err) {
    bool ok = guardedCall(
        {"SetPreference", "Failed to update speech style", ErrorKind::Initialization, "ERR_ENGINE_STYLE"},
        [&](std::string* detail) { return engine_.setPreference("SpeechStyle", speechStyle, detail); },
        err);
    if (ok) {
        styleUpdates_++;
        LOG_TRACE("Engine", "SpeechStyle=" + speechStyle);
    }
    return ok;
}

EngineStatus EngineInitializer::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::size_t EngineInitializer::fullInitializations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fullInits_;
}

std::size_t EngineInitializer::styleUpdates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return styleUpdates_;
}

std::optional<resources::RulesLocation> EngineInitializer::rulesLocation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return location_;
}

// =========================================================
// Process-wide engine states
// =========================================================
SharedEngineState::SharedEngineState(std::shared_ptr<engine::SpeechEngine> engine,
                                     EngineInitializer::RulesLocator locator,
                                     std::string language)
    : speech(std::move(engine)),
      initializer(*speech, std::move(locator), std::move(language)) {}

std::shared_ptr<SharedEngineState> sharedEngineState(std::shared_ptr<engine::SpeechEngine> speech,
                                                     EngineInitializer::RulesLocator locator,
                                                     std::string language) {
    // Entries live for the rest of the process
    static std::mutex registryMutex;
    static std::map<const engine::SpeechEngine*, std::shared_ptr<SharedEngineState>> registry;

    std::lock_guard<std::mutex> lock(registryMutex);
    auto it = registry.find(speech.get());
    if (it != registry.end()) {
        LOG_TRACE("Engine", "Reusing engine state");
        return it->second;
    }

    const engine::SpeechEngine* key = speech.get();
    auto state = std::make_shared<SharedEngineState>(std::move(speech), std::move(locator), std::move(language));
    registry.emplace(key, state);
    return state;
}

} // namespace mathwords
