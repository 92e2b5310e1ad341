#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mathwords::bootstrap_config {

// ----------------- defaults -----------------
nlohmann::json defaultConfig() {
    return {
        {"rules", {
            {"override_env", "MATHCAT_RULES_DIR"},
            {"local_dir", "Rules"},
            {"extract_dir", "mathwords_rules"}
        }},

        {"engine", {
            {"language", "en"},
            {"speech_library", "libmathwords_speech.so"},
            {"latex_library", "libmathwords_latex.so"},
            {"serialize_conversions", true}
        }},

        {"log", {
            {"level", "error"},
            {"file", ""}
        }},

        {"errors_file", ""}
    };
}

// ----------------- helpers -----------------
bool mergeDefaults(nlohmann::json& cfg, const nlohmann::json& defs, int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (cfg[key].type() != defVal.type()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

static const char* envOrNull(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                std::string* err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        outConfig = defaults;
        if (err) *err = path.string() + " not found";
        LOG_ERROR("Config", name + " not found: " + path.string() + " (using defaults)");
        LOG_PHASE(name + " load", false);
        return false;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) {
            throw std::runtime_error("top level is not an object");
        }

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        LOG_ERROR("Config", name + " invalid (" + e.what() + ") → using defaults");
        LOG_PHASE(name + " load", false);

        outConfig = defaults;
        return false;
    }
}

Settings settingsFromJson(const nlohmann::json& cfg) {
    nlohmann::json merged = cfg.is_object() ? cfg : nlohmann::json::object();
    mergeDefaults(merged, defaultConfig());

    Settings s;
    const auto& rules = merged["rules"];
    s.rules.overrideEnv = rules["override_env"].get<std::string>();
    s.rules.localDir    = rules["local_dir"].get<std::string>();
    s.rules.extractDir  = rules["extract_dir"].get<std::string>();

    const auto& engine = merged["engine"];
    s.engine.language             = engine["language"].get<std::string>();
    s.engine.speechLibrary        = engine["speech_library"].get<std::string>();
    s.engine.latexLibrary         = engine["latex_library"].get<std::string>();
    s.engine.serializeConversions = engine["serialize_conversions"].get<bool>();

    const auto& log = merged["log"];
    s.log.level = log["level"].get<std::string>();
    s.log.file  = log["file"].get<std::string>();

    s.errorsFile = merged["errors_file"].get<std::string>();
    return s;
}

Settings loadSettings() {
    nlohmann::json cfg = defaultConfig();

    if (const char* path = envOrNull(CONFIG_ENV)) {
        loadConfig(path, defaultConfig(), cfg, "mathwords config");
    }

    Settings s = settingsFromJson(cfg);

    if (const char* level = envOrNull(LOG_LEVEL_ENV)) {
        s.log.level = level;
    }
    return s;
}

// ----------------- entry -----------------
void initAll(const Settings& settings) {
    setLogLevel(parseLogLevel(settings.log.level));
    initLogger(settings.log.file);

    if (!settings.errorsFile.empty()) {
        std::string err;
        if (!ErrorManager::load(settings.errorsFile, &err)) {
            LOG_ERROR("Config", "Error catalog not loaded: " + err);
        }
    }

    LOG_PHASE("Configs initialized", true);
    LOG_DEBUG("Config", "language=" + settings.engine.language +
                        " speech_library=" + settings.engine.speechLibrary +
                        " latex_library=" + settings.engine.latexLibrary);
}

} // namespace mathwords::bootstrap_config
