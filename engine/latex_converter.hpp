#pragma once
#include <map>
#include <memory>
#include <string>

namespace mathwords::engine {

enum class DisplayMode {
    Inline,
    Block
};

// Converter construction options (defaults are what the pipeline uses)
struct LatexConfig {
    bool prettyPrint = false;       // indent the generated MathML
    bool xmlNamespace = false;      // emit xmlns on <math>
    std::map<std::string, std::string> macros;  // \name -> replacement

    std::string toJson() const;
};

// One configured LaTeX -> MathML converter
class LatexConverter {
public:
    virtual ~LatexConverter() = default;

    virtual bool convert(const std::string& latex,
                         DisplayMode mode,
                         std::string& mathml,
                         std::string* err) = 0;
};

// Factory for converters ("construct-with-config")
class LatexEngine {
public:
    virtual ~LatexEngine() = default;

    // Returns nullptr and fills *err on failure
    virtual std::unique_ptr<LatexConverter> create(const LatexConfig& config,
                                                   std::string* err) = 0;
};

} // namespace mathwords::engine
