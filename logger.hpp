#pragma once
#include <string>
#include <chrono>

// =====================================================
// Log Level
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Error,
    Off
};

// Parse "trace" / "debug" / "error" / "off" (case-insensitive).
// Unknown names map to Error.
LogLevel parseLogLevel(const std::string& name);

// =====================================================
// Phase Info Struct
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success = false;    // true = success, false = failure
};

// Most recent phase (for diagnostics)
PhaseInfo lastPhase();

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logDebug(const std::string& tag, const std::string& msg);
void logTrace(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Phase Groups: lines logged by this thread between begin and end
// are held back and written as one block. Groups nest.
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Lifecycle
// =====================================================
// Phases are written at Debug level and above; failed phases always
// pass when the threshold is Error.
void setLogLevel(LogLevel level);
LogLevel logLevel();

// Open (append) a log file. Empty filename keeps stderr-only output.
void initLogger(const std::string& filename);
void shutdownLogger();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
