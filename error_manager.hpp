#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mathwords {

// ------------------------------------------------------------
// Error taxonomy
// ------------------------------------------------------------
enum class ErrorKind {
    Validation,         // caller input malformed
    Initialization,     // rules dir / preference setup failed
    LatexConversion,    // LaTeX -> MathML stage failed
    MathMLConversion,   // MathML load or speech production failed
    Resource            // rules bundle extraction failed
};

const char* toString(ErrorKind kind);

// Unified failure value passed between layers
struct ErrorInfo {
    ErrorKind kind = ErrorKind::Initialization;
    std::string code;       // catalog code, e.g. "ERR_LATEX_CONVERSION"
    std::string message;    // detail, already prefixed by the failing operation
    bool panicked = false;  // true when an engine call threw instead of failing

    // "Failed to convert LaTeX to MathML: <message>"
    std::string describe() const;
};

ErrorInfo makeError(ErrorKind kind, const std::string& code, const std::string& message);

// ------------------------------------------------------------
// Exceptions thrown by the public API
// ------------------------------------------------------------
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(ErrorInfo info);
    const ErrorInfo& info() const noexcept { return info_; }

private:
    ErrorInfo info_;
};

class ConversionError : public std::runtime_error {
public:
    explicit ConversionError(ErrorInfo info);
    const ErrorInfo& info() const noexcept { return info_; }
    ErrorKind kind() const noexcept { return info_.kind; }
    bool panicked() const noexcept { return info_.panicked; }

private:
    ErrorInfo info_;
};

// Throws ValidationError for ErrorKind::Validation, ConversionError otherwise.
[[noreturn]] void raise(const ErrorInfo& info);

// ------------------------------------------------------------
// ErrorManager: code -> user/debug message catalog
// ------------------------------------------------------------
namespace ErrorManager {
    // Merge an errors.json file over the built-in catalog.
    // Returns false (catalog unchanged) when the file is missing or invalid.
    bool load(const std::string& path, std::string* err = nullptr);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log an error with its catalog debug message
    void report(const ErrorInfo& info);

    // Built-in catalog
    nlohmann::json defaultErrors();
}

} // namespace mathwords
