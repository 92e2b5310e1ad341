#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "engine/engine_abi.h"
#include "engine/latex_converter.hpp"
#include "engine/speech_engine.hpp"

namespace mathwords::engine {

// ------------------------------------------------------------
// SharedLibrary: owns one dlopen() handle
// ------------------------------------------------------------
class SharedLibrary {
public:
    SharedLibrary() = default;
    ~SharedLibrary();

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    // Tries <executable dir>/<name> first, then the loader search path.
    bool open(const std::string& name, std::string* err);
    bool isOpen() const noexcept { return handle_ != nullptr; }
    const std::string& path() const noexcept { return path_; }

    // nullptr when the export is missing
    void* symbol(const char* name) const;

    template <typename T>
    T function(const char* name) const {
        return reinterpret_cast<T>(symbol(name));
    }

private:
    void* handle_ = nullptr;
    std::string path_;
};

// Path used to key plugin engines: <executable dir>/<name> for plain names
// found there, otherwise the name itself; made canonical when it exists.
std::string resolveLibraryPath(const std::string& name);

// ------------------------------------------------------------
// PluginSpeechEngine: SpeechEngine backed by libmathwords_speech
//
// The loaded library keeps one global engine, so there is one
// PluginSpeechEngine per resolved library path, obtained from shared().
// The library is loaded on the first call; a load failure is reported
// by that call (and retried by the next one).
// ------------------------------------------------------------
class PluginSpeechEngine : public SpeechEngine {
public:
    // Same instance for every name resolving to the same library
    static std::shared_ptr<PluginSpeechEngine> shared(const std::string& libraryName);

    const std::string& libraryPath() const noexcept { return library_name_; }

    bool setRulesDir(const std::string& path, std::string* err) override;
    bool setPreference(const std::string& name, const std::string& value, std::string* err) override;
    bool setMathML(const std::string& mathml, std::string* err) override;
    bool getSpokenText(std::string& text, std::string* err) override;

private:
    explicit PluginSpeechEngine(std::string libraryName);

    bool ensureLoaded(std::string* err);

    // Copies and frees a plugin-owned error string
    std::string takeString(char* str);

    std::string library_name_;
    std::mutex load_mutex_;
    SharedLibrary lib_;

    using setRulesDir_t    = int (*)(const char* rulesDirUtf8, char** errorOut);
    using setPreference_t  = int (*)(const char* nameUtf8, const char* valueUtf8, char** errorOut);
    using setMathML_t      = int (*)(const char* mathmlUtf8, char** errorOut);
    using getSpokenText_t  = int (*)(char** textOut, char** errorOut);
    using freeString_t     = void (*)(char* str);
    using getABIVersion_t  = int (*)(void);

    setRulesDir_t   mwSpeech_setRulesDir_ = nullptr;
    setPreference_t mwSpeech_setPreference_ = nullptr;
    setMathML_t     mwSpeech_setMathML_ = nullptr;
    getSpokenText_t mwSpeech_getSpokenText_ = nullptr;
    freeString_t    mwSpeech_freeString_ = nullptr;
};

// ------------------------------------------------------------
// PluginLatexEngine: LatexEngine backed by libmathwords_latex
// ------------------------------------------------------------
class PluginLatexEngine : public LatexEngine {
public:
    explicit PluginLatexEngine(std::string libraryName);

    std::unique_ptr<LatexConverter> create(const LatexConfig& config, std::string* err) override;

    using create_t     = mwLatex_handle_t (*)(const char* configJson, char** errorOut);
    using destroy_t    = void (*)(mwLatex_handle_t handle);
    using convert_t    = int (*)(mwLatex_handle_t handle, const char* latexUtf8, int displayBlock,
                                 char** mathmlOut, char** errorOut);
    using freeString_t = void (*)(char* str);
    using getABIVersion_t = int (*)(void);

private:
    bool ensureLoaded(std::string* err);

    std::string library_name_;
    std::mutex load_mutex_;
    std::shared_ptr<SharedLibrary> lib_;   // shared with live converters

    create_t     mwLatex_create_ = nullptr;
    destroy_t    mwLatex_destroy_ = nullptr;
    convert_t    mwLatex_convert_ = nullptr;
    freeString_t mwLatex_freeString_ = nullptr;
};

} // namespace mathwords::engine
