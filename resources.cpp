#include "resources.hpp"
#include "logger.hpp"

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace mathwords::resources {

fs::path executableDir() {
    std::error_code ec;
    fs::path exePath = fs::canonical("/proc/self/exe", ec);
    if (!ec && exePath.has_parent_path()) {
        return exePath.parent_path();
    }
    return fs::current_path(ec);
}

const char* toString(RulesSource source) {
    switch (source) {
        case RulesSource::Override:  return "override";
        case RulesSource::Local:     return "local";
        case RulesSource::Extracted: return "extracted";
    }
    return "unknown";
}

static bool isDirectory(const fs::path& p) {
    std::error_code ec;
    return !p.empty() && fs::is_directory(p, ec);
}

static ErrorInfo resourceError(const std::string& message) {
    return makeError(ErrorKind::Resource, "ERR_RULES_RESOURCE", message);
}

bool resolveRulesDirectory(const ResolveOptions& options,
                           RulesLocation& location,
                           ErrorInfo* err) {
    // 🔹 1. Override variable
    if (!options.overrideEnv.empty()) {
        const char* value = std::getenv(options.overrideEnv.c_str());
        if (value && *value) {
            if (isDirectory(value)) {
                location = {fs::path(value), RulesSource::Override, false};
                LOG_DEBUG("Resources", "Rules from $" + options.overrideEnv + ": " + location.path.string());
                return true;
            }
            LOG_TRACE("Resources", "$" + options.overrideEnv + " = " + value + " is not a directory, ignored");
        }
    }

    // 🔹 2. Local Rules directory
    for (const auto& candidate : options.localCandidates) {
        if (isDirectory(candidate)) {
            location = {candidate, RulesSource::Local, false};
            LOG_DEBUG("Resources", "Rules from local directory: " + candidate.string());
            return true;
        }
    }

    // 🔹 3. Embedded bundle
    if (options.extractRoot.empty()) {
        if (err) *err = resourceError("No temporary directory for rules extraction");
        return false;
    }

    fs::path target = options.extractRoot / options.extractDirName;
    std::error_code ec;
    if (fs::exists(target, ec)) {
        location = {target, RulesSource::Extracted, false};
        LOG_DEBUG("Resources", "Rules already extracted: " + target.string());
        return true;
    }

    std::string ioError;
    if (!extractBundle(options.bundle, target, &ioError)) {
        std::error_code cleanup;
        fs::remove_all(target, cleanup);
        if (cleanup) {
            LOG_ERROR("Resources", "Could not remove partial extraction " + target.string() + ": " + cleanup.message());
        }
        if (err) *err = resourceError("Failed to extract rules to " + target.string() + ": " + ioError);
        LOG_PHASE("Rules extraction", false);
        return false;
    }

    location = {target, RulesSource::Extracted, true};
    LOG_PHASE("Rules extraction", true);
    return true;
}

ResolveOptions makeResolveOptions(const bootstrap_config::RulesSettings& settings) {
    ResolveOptions options;
    options.overrideEnv = settings.overrideEnv;
    options.extractDirName = settings.extractDir;

    if (!settings.localDir.empty()) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (!ec) options.localCandidates.push_back(cwd / settings.localDir);
        options.localCandidates.push_back(executableDir() / settings.localDir);
    }

    std::error_code ec;
    options.extractRoot = fs::temp_directory_path(ec);
    if (ec) {
        LOG_ERROR("Resources", "No temporary directory: " + ec.message());
        options.extractRoot.clear();
    }

    options.bundle = embeddedRules();
    return options;
}

} // namespace mathwords::resources
