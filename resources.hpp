#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources/rules_bundle.hpp"

namespace mathwords::resources {

// Directory of the running executable (/proc/self/exe), or the current
// directory if that cannot be read
std::filesystem::path executableDir();

// ------------------------------------------------------------
// Rules directory resolution
// ------------------------------------------------------------
struct ResolveOptions {
    std::string overrideEnv = "MATHCAT_RULES_DIR";        // empty = no override
    std::vector<std::filesystem::path> localCandidates;   // checked in order
    std::filesystem::path extractRoot;                    // usually the tmp dir
    std::string extractDirName = "mathwords_rules";
    RulesBundle bundle;
};

enum class RulesSource {
    Override,
    Local,
    Extracted
};

const char* toString(RulesSource source);

struct RulesLocation {
    std::filesystem::path path;
    RulesSource source = RulesSource::Extracted;
    bool extracted = false;   // true only when this call wrote the bundle
};

// First match wins: override variable, local candidates, embedded bundle.
// Existing extraction target is reused without touching it.
bool resolveRulesDirectory(const ResolveOptions& options,
                           RulesLocation& location,
                           ErrorInfo* err);

// Options for the process: cwd/<local_dir>, <exe dir>/<local_dir>,
// <tmp>/<extract_dir>, embedded bundle
ResolveOptions makeResolveOptions(const bootstrap_config::RulesSettings& settings);

} // namespace mathwords::resources
