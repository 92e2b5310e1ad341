#include "resources/rules_bundle.hpp"
#include "logger.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace mathwords::resources {

std::size_t RulesBundle::totalBytes() const {
    std::size_t total = 0;
    for (std::size_t i = 0; i < count; i++) {
        total += files[i].size;
    }
    return total;
}

// Rejects absolute paths and ".." so every file stays under target
static bool isContained(const fs::path& relative) {
    if (relative.empty() || relative.is_absolute() || relative.has_root_path()) {
        return false;
    }
    for (const auto& part : relative) {
        if (part == "..") return false;
    }
    return true;
}

bool extractBundle(const RulesBundle& bundle, const fs::path& target, std::string* err) {
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        if (err) *err = "Failed to create " + target.string() + ": " + ec.message();
        return false;
    }

    for (std::size_t i = 0; i < bundle.count; i++) {
        const EmbeddedFile& file = bundle.files[i];
        fs::path relative = fs::path(file.path).lexically_normal();

        if (!isContained(relative)) {
            if (err) *err = std::string("Embedded path escapes the rules tree: ") + file.path;
            return false;
        }

        fs::path filePath = target / relative;
        if (filePath.has_parent_path()) {
            fs::create_directories(filePath.parent_path(), ec);
            if (ec) {
                if (err) *err = "Failed to create " + filePath.parent_path().string() + ": " + ec.message();
                return false;
            }
        }

        std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (err) *err = "Failed to open " + filePath.string() + " for writing";
            return false;
        }
        out.write(reinterpret_cast<const char*>(file.data), static_cast<std::streamsize>(file.size));
        out.close();
        if (!out) {
            if (err) *err = "Failed to write " + filePath.string();
            return false;
        }
    }

    LOG_DEBUG("Resources", "Extracted " + std::to_string(bundle.count) + " files (" +
                           std::to_string(bundle.totalBytes()) + " bytes) to " + target.string());
    return true;
}

} // namespace mathwords::resources
