#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace {

// =====================================================
// Output sink (stderr + optional file)
// =====================================================
struct LogSink {
    std::mutex mutex;
    LogLevel threshold = LogLevel::Error;
    PhaseInfo last{};
    std::ofstream file;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

// 🔹 Phase groups are per thread: an initializing thread buffers its own
// lines while other threads keep logging directly
thread_local int t_groupDepth = 0;
thread_local std::vector<std::string> t_groupLines;

std::string stamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    std::time_t secs = system_clock::to_time_t(tp);
    auto millis = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis;
    return out.str();
}

std::string fileNameOf(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

bool passes(const LogSink& s, LogLevel level) {
    return s.threshold != LogLevel::Off && level >= s.threshold;
}

// Caller holds sink().mutex
void write(LogSink& s, const std::string& line) {
    std::cerr << line << '\n';
    if (s.file.is_open()) {
        s.file << line << '\n';
        s.file.flush();
    }
}

void submit(LogLevel level, const char* name, const std::string& tag, const std::string& msg) {
    LogSink& s = sink();
    std::string line = "[" + stamp(std::chrono::system_clock::now()) + "][" + name + "][" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(s.mutex);
    if (!passes(s, level)) return;
    if (t_groupDepth > 0) {
        t_groupLines.push_back(std::move(line));
        return;
    }
    write(s, line);
}

} // namespace

// =====================================================
// Level
// =====================================================
LogLevel parseLogLevel(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (unsigned char c : name) key.push_back(static_cast<char>(std::tolower(c)));

    if (key == "trace") return LogLevel::Trace;
    if (key == "debug") return LogLevel::Debug;
    if (key == "off" || key == "none") return LogLevel::Off;
    return LogLevel::Error;
}

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(sink().mutex);
    sink().threshold = level;
}

LogLevel logLevel() {
    std::lock_guard<std::mutex> lock(sink().mutex);
    return sink().threshold;
}

// =====================================================
// Phase groups
// =====================================================
void beginPhaseGroup() {
    if (t_groupDepth++ == 0) {
        t_groupLines.clear();
    }
}

void endPhaseGroup() {
    if (t_groupDepth == 0) return;
    if (--t_groupDepth > 0) return;

    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    for (const auto& line : t_groupLines) {
        write(s, line);
    }
    t_groupLines.clear();
}

// =====================================================
// Phases
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    PhaseInfo info;
    info.timestamp = std::chrono::system_clock::now();
    info.fileName = fileNameOf(file);
    info.phaseName = phase;
    info.success = success;

    std::string row = "| " + stamp(info.timestamp) + " | " + info.fileName + " | " +
                      info.phaseName + " | " + (success ? "ok" : "FAILED") + " |";

    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.last = info;

    // Failed phases are errors, completed ones are debug output
    if (!passes(s, success ? LogLevel::Debug : LogLevel::Error)) return;
    if (t_groupDepth > 0) {
        t_groupLines.push_back(std::move(row));
        return;
    }
    write(s, row);
}

PhaseInfo lastPhase() {
    std::lock_guard<std::mutex> lock(sink().mutex);
    return sink().last;
}

// =====================================================
// Tagged lines
// =====================================================
void logDebug(const std::string& tag, const std::string& msg) { submit(LogLevel::Debug, "DEBUG", tag, msg); }
void logTrace(const std::string& tag, const std::string& msg) { submit(LogLevel::Trace, "TRACE", tag, msg); }
void logError(const std::string& tag, const std::string& msg) { submit(LogLevel::Error, "ERROR", tag, msg); }

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename) {
    if (filename.empty()) return;

    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) return;

    std::error_code ec;
    std::filesystem::path target = std::filesystem::absolute(filename, ec);
    if (ec) target = filename;

    s.file.open(target, std::ios::out | std::ios::app);
    if (!s.file) {
        std::cerr << "[Logger] Could not open log file " << target.string() << '\n';
        return;
    }
    s.file << "==== mathwords log opened " << stamp(std::chrono::system_clock::now()) << " ====\n";
}

void shutdownLogger() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.file.is_open()) return;
    s.file << "==== mathwords log closed ====\n";
    s.file.close();
}
