#pragma once
#include <string>
#include <chrono>

// =====================================================
// Log levels (ordered, lowest = most verbose)
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Warn,
    Error,
    Off
};

// =====================================================
// Phase Info Struct
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success = false;
};

// Copy of the most recent LOG_PHASE record
PhaseInfo lastPhase();

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();

// Lines below this level are discarded. Per-frame audio logging uses
// Trace, so the default (Debug) keeps the audio loop quiet.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool parseLogLevel(const std::string& name, LogLevel& out);

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logDebug(const std::string& tag, const std::string& msg);
void logTrace(const std::string& tag, const std::string& msg);
void logWarn(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_WARN(tag, msg) logWarn(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
