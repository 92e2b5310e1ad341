#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

namespace mathwords::resources {

// One file of the rules tree, path relative to the tree root ("en/ClearSpeak_Rules.yaml")
struct EmbeddedFile {
    const char* path;
    const unsigned char* data;
    std::size_t size;
};

// Read-only view over an embedded tree
struct RulesBundle {
    const EmbeddedFile* files = nullptr;
    std::size_t count = 0;

    bool empty() const { return count == 0; }
    std::size_t totalBytes() const;
};

// Tree captured from Rules/ at build time (generated source)
RulesBundle embeddedRules();

// Write every bundle file under target, creating parent directories and
// keeping relative paths. Stops at the first I/O failure.
bool extractBundle(const RulesBundle& bundle,
                   const std::filesystem::path& target,
                   std::string* err);

} // namespace mathwords::resources
