#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

// Centralized configuration bootstrap for mathwords
namespace mathwords::bootstrap_config {

    // Environment variable naming an optional JSON config file
    inline constexpr const char* CONFIG_ENV = "MATHWORDS_CONFIG";
    // Environment variable overriding log.level
    inline constexpr const char* LOG_LEVEL_ENV = "MATHWORDS_LOG_LEVEL";

    struct RulesSettings {
        std::string overrideEnv = "MATHCAT_RULES_DIR";
        std::string localDir = "Rules";
        std::string extractDir = "mathwords_rules";
    };

    struct EngineSettings {
        std::string language = "en";
        std::string speechLibrary = "libmathwords_speech.so";
        std::string latexLibrary = "libmathwords_latex.so";
        bool serializeConversions = true;
    };

    struct LogSettings {
        std::string level = "error";
        std::string file;
    };

    struct Settings {
        RulesSettings rules;
        EngineSettings engine;
        LogSettings log;
        std::string errorsFile;
    };

    // Canonical defaults
    nlohmann::json defaultConfig();

    // Patch missing or wrongly-typed keys of cfg from defs (recursive).
    // Returns true if anything was patched.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Generic loader: reads path, patches it with defaults.
    // Missing or invalid file -> outConfig = defaults, returns false.
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    std::string* err = nullptr);

    Settings settingsFromJson(const nlohmann::json& cfg);

    // Defaults, then $MATHWORDS_CONFIG, then environment overrides
    Settings loadSettings();

    // Apply logging settings and load the error catalog override
    void initAll(const Settings& settings);
}
