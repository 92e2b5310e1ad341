#include "engine/plugin_engines.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <dlfcn.h>
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

namespace mathwords::engine {

// =========================================================
// SharedLibrary
// =========================================================
SharedLibrary::~SharedLibrary() {
    if (handle_) {
        dlclose(handle_);
        handle_ = nullptr;
    }
}

bool SharedLibrary::open(const std::string& name, std::string* err) {
    if (handle_) return true;

    std::string lastError;
    auto tryOpen = [&](const std::string& candidate) -> bool {
        dlerror();
        handle_ = dlopen(candidate.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (handle_) {
            path_ = candidate;
            return true;
        }
        const char* msg = dlerror();
        lastError = msg ? msg : ("could not load " + candidate);
        return false;
    };

    // Plain file names are looked up beside the executable first
    if (fs::path(name).filename() == fs::path(name)) {
        std::error_code ec;
        fs::path local = resources::executableDir() / name;
        if (fs::exists(local, ec) && tryOpen(local.string())) {
            LOG_DEBUG("Engine", "Loaded " + path_);
            return true;
        }
    }

    if (tryOpen(name)) {
        LOG_DEBUG("Engine", "Loaded " + path_);
        return true;
    }

    if (err) *err = lastError;
    LOG_ERROR("Engine", "Could not load engine library " + name + ": " + lastError);
    return false;
}

void* SharedLibrary::symbol(const char* name) const {
    if (!handle_) return nullptr;
    return dlsym(handle_, name);
}

std::string resolveLibraryPath(const std::string& name) {
    std::error_code ec;
    fs::path path(name);
    if (path.filename() == path) {
        fs::path local = resources::executableDir() / name;
        if (!fs::exists(local, ec)) return name;
        path = local;
    }
    fs::path canonical = fs::weakly_canonical(path, ec);
    return ec ? path.string() : canonical.string();
}

// =========================================================
// PluginSpeechEngine
// =========================================================
PluginSpeechEngine::PluginSpeechEngine(std::string libraryName)
    : library_name_(std::move(libraryName)) {}

std::shared_ptr<PluginSpeechEngine> PluginSpeechEngine::shared(const std::string& libraryName) {
    static std::mutex registryMutex;
    static std::map<std::string, std::shared_ptr<PluginSpeechEngine>> registry;

    const std::string path = resolveLibraryPath(libraryName);
    std::lock_guard<std::mutex> lock(registryMutex);
    auto& engine = registry[path];
    if (!engine) {
        engine.reset(new PluginSpeechEngine(path));
        LOG_DEBUG("Engine", "Registered speech engine " + path);
    }
    return engine;
}

bool PluginSpeechEngine::ensureLoaded(std::string* err) {
    std::lock_guard<std::mutex> lock(load_mutex_);
    if (mwSpeech_getSpokenText_) return true;

    if (!lib_.open(library_name_, err)) {
        return false;
    }

    auto setRulesDir   = lib_.function<setRulesDir_t>("mwSpeech_setRulesDir");
    auto setPreference = lib_.function<setPreference_t>("mwSpeech_setPreference");
    auto setMathML     = lib_.function<setMathML_t>("mwSpeech_setMathML");
    auto getSpokenText = lib_.function<getSpokenText_t>("mwSpeech_getSpokenText");
    auto freeString    = lib_.function<freeString_t>("mwSpeech_freeString");

    if (!setRulesDir || !setPreference || !setMathML || !getSpokenText || !freeString) {
        if (err) *err = lib_.path() + " is missing required mwSpeech_* exports";
        LOG_ERROR("Engine", lib_.path() + " is missing required mwSpeech_* exports");
        return false;
    }

    // Optional export
    if (auto abi = lib_.function<getABIVersion_t>("mwSpeech_getABIVersion")) {
        int version = abi();
        LOG_DEBUG("Engine", "Speech plugin ABI version " + std::to_string(version));
        if (version != MATHWORDS_ENGINE_ABI_VERSION) {
            std::string msg = "speech plugin ABI " + std::to_string(version) +
                              " does not match " + std::to_string(MATHWORDS_ENGINE_ABI_VERSION);
            if (err) *err = msg;
            LOG_ERROR("Engine", lib_.path() + ": " + msg);
            return false;
        }
    }

    mwSpeech_setRulesDir_   = setRulesDir;
    mwSpeech_setPreference_ = setPreference;
    mwSpeech_setMathML_     = setMathML;
    mwSpeech_freeString_    = freeString;
    mwSpeech_getSpokenText_ = getSpokenText;
    return true;
}

std::string PluginSpeechEngine::takeString(char* str) {
    if (!str) return {};
    std::string out(str);
    mwSpeech_freeString_(str);
    return out;
}

bool PluginSpeechEngine::setRulesDir(const std::string& path, std::string* err) {
    if (!ensureLoaded(err)) return false;

    char* error = nullptr;
    if (mwSpeech_setRulesDir_(path.c_str(), &error) != 1) {
        std::string msg = takeString(error);
        if (err) *err = msg;
        return false;
    }
    takeString(error);
    return true;
}

bool PluginSpeechEngine::setPreference(const std::string& name, const std::string& value, std::string* err) {
    if (!ensureLoaded(err)) return false;

    char* error = nullptr;
    if (mwSpeech_setPreference_(name.c_str(), value.c_str(), &error) != 1) {
        std::string msg = takeString(error);
        if (err) *err = msg;
        return false;
    }
    takeString(error);
    return true;
}

bool PluginSpeechEngine::setMathML(const std::string& mathml, std::string* err) {
    if (!ensureLoaded(err)) return false;

    char* error = nullptr;
    if (mwSpeech_setMathML_(mathml.c_str(), &error) != 1) {
        std::string msg = takeString(error);
        if (err) *err = msg;
        return false;
    }
    takeString(error);
    return true;
}

bool PluginSpeechEngine::getSpokenText(std::string& text, std::string* err) {
    if (!ensureLoaded(err)) return false;

    char* spoken = nullptr;
    char* error = nullptr;
    int rc = mwSpeech_getSpokenText_(&spoken, &error);
    std::string result = takeString(spoken);
    std::string msg = takeString(error);

    if (rc != 1) {
        if (err) *err = msg;
        return false;
    }
    text = std::move(result);
    return true;
}

// =========================================================
// PluginLatexConverter
// =========================================================
namespace {

class PluginLatexConverter : public LatexConverter {
public:
    PluginLatexConverter(std::shared_ptr<SharedLibrary> lib,
                         mwLatex_handle_t handle,
                         PluginLatexEngine::destroy_t destroy,
                         PluginLatexEngine::convert_t convert,
                         PluginLatexEngine::freeString_t freeString)
        : lib_(std::move(lib)), handle_(handle),
          destroy_(destroy), convert_(convert), freeString_(freeString) {}

    ~PluginLatexConverter() override {
        if (handle_) destroy_(handle_);
    }

    PluginLatexConverter(const PluginLatexConverter&) = delete;
    PluginLatexConverter& operator=(const PluginLatexConverter&) = delete;

    bool convert(const std::string& latex, DisplayMode mode,
                 std::string& mathml, std::string* err) override {
        char* out = nullptr;
        char* error = nullptr;
        int rc = convert_(handle_, latex.c_str(), mode == DisplayMode::Block ? 1 : 0, &out, &error);
        std::string result = take(out);
        std::string msg = take(error);

        if (rc != 1) {
            if (err) *err = msg;
            return false;
        }
        mathml = std::move(result);
        return true;
    }

private:
    std::string take(char* str) {
        if (!str) return {};
        std::string s(str);
        freeString_(str);
        return s;
    }

    std::shared_ptr<SharedLibrary> lib_;
    mwLatex_handle_t handle_;
    PluginLatexEngine::destroy_t destroy_;
    PluginLatexEngine::convert_t convert_;
    PluginLatexEngine::freeString_t freeString_;
};

} // namespace

// =========================================================
// PluginLatexEngine
// =========================================================
PluginLatexEngine::PluginLatexEngine(std::string libraryName)
    : library_name_(std::move(libraryName)),
      lib_(std::make_shared<SharedLibrary>()) {}

bool PluginLatexEngine::ensureLoaded(std::string* err) {
    std::lock_guard<std::mutex> lock(load_mutex_);
    if (mwLatex_convert_) return true;

    if (!lib_->open(library_name_, err)) {
        return false;
    }

    auto create     = lib_->function<create_t>("mwLatex_create");
    auto destroy    = lib_->function<destroy_t>("mwLatex_destroy");
    auto convert    = lib_->function<convert_t>("mwLatex_convert");
    auto freeString = lib_->function<freeString_t>("mwLatex_freeString");

    if (!create || !destroy || !convert || !freeString) {
        if (err) *err = lib_->path() + " is missing required mwLatex_* exports";
        LOG_ERROR("Engine", lib_->path() + " is missing required mwLatex_* exports");
        return false;
    }

    if (auto abi = lib_->function<getABIVersion_t>("mwLatex_getABIVersion")) {
        int version = abi();
        LOG_DEBUG("Engine", "LaTeX plugin ABI version " + std::to_string(version));
        if (version != MATHWORDS_ENGINE_ABI_VERSION) {
            std::string msg = "LaTeX plugin ABI " + std::to_string(version) +
                              " does not match " + std::to_string(MATHWORDS_ENGINE_ABI_VERSION);
            if (err) *err = msg;
            LOG_ERROR("Engine", lib_->path() + ": " + msg);
            return false;
        }
    }

    mwLatex_create_     = create;
    mwLatex_destroy_    = destroy;
    mwLatex_freeString_ = freeString;
    mwLatex_convert_    = convert;
    return true;
}

std::unique_ptr<LatexConverter> PluginLatexEngine::create(const LatexConfig& config, std::string* err) {
    if (!ensureLoaded(err)) return nullptr;

    char* error = nullptr;
    mwLatex_handle_t handle = mwLatex_create_(config.toJson().c_str(), &error);

    std::string msg;
    if (error) {
        msg = error;
        mwLatex_freeString_(error);
    }

    if (!handle) {
        if (err) *err = msg.empty() ? "converter construction failed" : msg;
        return nullptr;
    }

    return std::make_unique<PluginLatexConverter>(lib_, handle, mwLatex_destroy_,
                                                  mwLatex_convert_, mwLatex_freeString_);
}

} // namespace mathwords::engine
