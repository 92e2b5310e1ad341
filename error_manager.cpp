#include "error_manager.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace mathwords {

// ------------------------------------------------------------
// ErrorInfo
// ------------------------------------------------------------
const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:       return "ValidationError";
        case ErrorKind::Initialization:   return "InitializationError";
        case ErrorKind::LatexConversion:  return "LatexConversionError";
        case ErrorKind::MathMLConversion: return "MathMLConversionError";
        case ErrorKind::Resource:         return "ResourceError";
    }
    return "UnknownError";
}

std::string ErrorInfo::describe() const {
    switch (kind) {
        case ErrorKind::Validation:       return "Invalid input: " + message;
        case ErrorKind::Initialization:   return "Failed to initialize speech engine: " + message;
        case ErrorKind::LatexConversion:  return "Failed to convert LaTeX to MathML: " + message;
        case ErrorKind::MathMLConversion: return "Failed to convert MathML to speech: " + message;
        case ErrorKind::Resource:         return "Resource error: " + message;
    }
    return message;
}

ErrorInfo makeError(ErrorKind kind, const std::string& code, const std::string& message) {
    ErrorInfo info;
    info.kind = kind;
    info.code = code;
    info.message = message;
    return info;
}

// ------------------------------------------------------------
// Exceptions
// ------------------------------------------------------------
ValidationError::ValidationError(ErrorInfo info)
    : std::invalid_argument(info.message), info_(std::move(info)) {}

ConversionError::ConversionError(ErrorInfo info)
    : std::runtime_error(info.describe()), info_(std::move(info)) {}

void raise(const ErrorInfo& info) {
    if (info.kind == ErrorKind::Validation) {
        throw ValidationError(info);
    }
    throw ConversionError(info);
}

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
static std::mutex g_catalogMutex;
static nlohmann::json g_catalog;   // { code: { "user": ..., "debug": ... } }

static void ensureCatalogLocked() {
    if (!g_catalog.is_object() || g_catalog.empty()) {
        g_catalog = ErrorManager::defaultErrors();
    }
}

nlohmann::json ErrorManager::defaultErrors() {
    return {
        {"ERR_EMPTY_INPUT", {
            {"user", "Input string is empty"},
            {"debug", "verbalize called with an empty or whitespace-only expression."}
        }},
        {"ERR_EMPTY_BATCH", {
            {"user", "Expression list is empty"},
            {"debug", "verbalizeBatch called with no expressions."}
        }},
        {"ERR_RULES_RESOURCE", {
            {"user", "[Rules] Could not prepare the speech rules directory."},
            {"debug", "Rules bundle extraction or directory creation failed."}
        }},
        {"ERR_ENGINE_INIT", {
            {"user", "[Engine] Speech engine could not be initialized."},
            {"debug", "Rules directory or engine preference setup failed."}
        }},
        {"ERR_ENGINE_STYLE", {
            {"user", "[Engine] Speech style could not be changed."},
            {"debug", "SpeechStyle preference update failed on a ready engine."}
        }},
        {"ERR_LATEX_CONVERSION", {
            {"user", "[LaTeX] Expression could not be converted."},
            {"debug", "LaTeX converter construction or conversion failed."}
        }},
        {"ERR_MATHML_CONVERSION", {
            {"user", "[MathML] Expression could not be spoken."},
            {"debug", "SetMathML or GetSpokenText failed."}
        }},
        {"ERR_ENGINE_PANIC", {
            {"user", "[Engine] Internal engine failure."},
            {"debug", "An engine call threw; contained at the engine boundary."}
        }},
        {"ERR_CLI_UNKNOWN_COMMAND", {
            {"user", "[CLI] Unknown command"},
            {"debug", "dispatchCommand found no handler."}
        }},
        {"ERR_CLI_BATCH_FILE", {
            {"user", "[CLI] Usage: batch <file>"},
            {"debug", "Batch file missing or unreadable."}
        }}
    };
}

bool ErrorManager::load(const std::string& path, std::string* err) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        if (err) *err = "Could not open " + path;
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json loaded;
        in >> loaded;

        const nlohmann::json& root =
            (loaded.contains("errors") && loaded["errors"].is_object()) ? loaded["errors"] : loaded;
        if (!root.is_object()) {
            if (err) *err = path + " is not a JSON object";
            return false;
        }

        std::lock_guard<std::mutex> lock(g_catalogMutex);
        ensureCatalogLocked();
        for (auto& [code, entry] : root.items()) {
            if (entry.is_object()) {
                g_catalog[code].update(entry);
            }
        }

        LOG_PHASE("Error catalog load", true);
        LOG_DEBUG("ErrorManager", "Merged error catalog from: " + fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        LOG_PHASE("Error catalog load", false);
        return false;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    ensureCatalogLocked();
    if (g_catalog.contains(code) && g_catalog[code].contains("user")) {
        return g_catalog[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_catalogMutex);
    ensureCatalogLocked();
    if (g_catalog.contains(code) && g_catalog[code].contains("debug")) {
        return g_catalog[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

void ErrorManager::report(const ErrorInfo& info) {
    std::string code = info.code.empty() ? "ERR_NONE" : info.code;
    std::string line = code + " -> " + getDebugMessage(code) + " (" + toString(info.kind);
    if (info.panicked) line += ", panicked";
    line += "): " + info.message;
    LOG_ERROR("ErrorManager", line);
}

} // namespace mathwords
