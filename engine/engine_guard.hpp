#pragma once
#include <exception>
#include <string>
#include <utility>

#include "error_manager.hpp"
#include "logger.hpp"

namespace mathwords::engine {

// ------------------------------------------------------------
// Describes one call across the engine boundary
// ------------------------------------------------------------
struct EngineCall {
    const char* operation;  // "SetRulesDir" -> "SetRulesDir panicked"
    const char* failure;    // "Failed to set rules directory" -> "<failure>: <detail>"
    ErrorKind kind;
    const char* code;       // catalog code for ordinary failures
};

// ------------------------------------------------------------
// guardedCall
//
// Runs fn(std::string* detail) -> bool. A false return becomes
// "<failure>: <detail>" of call.kind; anything thrown out of fn becomes
// "<operation> panicked" of the same kind with panicked = true.
// Nothing thrown by fn escapes this function.
// ------------------------------------------------------------
template <typename Fn>
bool guardedCall(const EngineCall& call, Fn&& fn, ErrorInfo* err) {
    std::string detail;
    std::string crash;
    bool ok = false;
    bool threw = false;

    try {
        ok = std::forward<Fn>(fn)(&detail);
    } catch (const std::exception& e) {
        threw = true;
        crash = e.what();
    } catch (...) {
        threw = true;
        crash = "non-standard exception";
    }

    if (threw) {
        ErrorInfo info = makeError(call.kind, "ERR_ENGINE_PANIC",
                                   std::string(call.operation) + " panicked");
        info.panicked = true;
        LOG_ERROR("EngineGuard", info.message + " (" + crash + ")");
        if (err) *err = std::move(info);
        return false;
    }

    if (!ok) {
        if (detail.empty()) detail = "unknown error";
        if (err) *err = makeError(call.kind, call.code, std::string(call.failure) + ": " + detail);
        LOG_TRACE("EngineGuard", std::string(call.operation) + " failed: " + detail);
        return false;
    }

    return true;
}

} // namespace mathwords::engine
