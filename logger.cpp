#include "logger.hpp"

#include <atomic>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <vector>
#include <filesystem>
#include <chrono>

// =====================================================
// Globals
// =====================================================
static PhaseInfo g_phaseInfo{};
static std::mutex g_logMutex;
static std::atomic<LogLevel> g_logLevel{LogLevel::Debug};

// Buffer for grouped phase logging
static bool g_buffering = false;
static std::vector<std::string> g_phaseBuffer;

// File output stream
static std::ofstream g_logFile;

// =====================================================
// Helpers
// =====================================================
static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

static std::string nowTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

static std::string basename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

static bool enabled(LogLevel level) {
    return level >= g_logLevel.load(std::memory_order_relaxed);
}

static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << '\n';
        g_logFile.flush();
    }
    std::cerr << line << std::endl;
}

static void writeTagged(LogLevel level, const char* name,
                        const std::string& tag, const std::string& msg) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine("[" + nowTimestamp() + "][" + name + "][" + tag + "] " + msg);
}

// =====================================================
// Level control
// =====================================================
void setLogLevel(LogLevel level) {
    g_logLevel.store(level, std::memory_order_relaxed);
}

LogLevel getLogLevel() {
    return g_logLevel.load(std::memory_order_relaxed);
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    if (name == "trace") { out = LogLevel::Trace; return true; }
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    if (name == "off")   { out = LogLevel::Off;   return true; }
    return false;
}

PhaseInfo lastPhase() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_phaseInfo;
}

// =====================================================
// Buffering controls
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_buffering = true;
    g_phaseBuffer.clear();
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    for (auto& line : g_phaseBuffer) {
        writeLine(line);
    }
    g_phaseBuffer.clear();
    g_buffering = false;
}

// =====================================================
// Phase Logging
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    std::lock_guard<std::mutex> lock(g_logMutex);

    g_phaseInfo.timestamp = std::chrono::system_clock::now();
    g_phaseInfo.fileName  = basename(file);
    g_phaseInfo.phaseName = phase;
    g_phaseInfo.success   = success;

    if (!enabled(success ? LogLevel::Debug : LogLevel::Error)) return;

    std::ostringstream oss;
    oss << "| " << formatTimestamp(g_phaseInfo.timestamp)
        << " | " << g_phaseInfo.fileName
        << " | " << g_phaseInfo.phaseName
        << " | " << (g_phaseInfo.success ? "true" : "false")
        << " |";

    std::string entry = oss.str();

    if (g_buffering) {
        g_phaseBuffer.push_back(entry);
    } else {
        writeLine(entry);
    }
}

// =====================================================
// Debug / Trace / Warn / Error Logging
// =====================================================
void logDebug(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Debug, "DEBUG", tag, msg);
}

void logTrace(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Trace, "TRACE", tag, msg);
}

void logWarn(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Warn, "WARN", tag, msg);
}

void logError(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Error, "ERROR", tag, msg);
}

// =====================================================
// Lifecycle
// =====================================================
namespace fs = std::filesystem;

void initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    fs::path logPath = fs::absolute(filename);
    g_logFile.open(logPath, std::ios::out | std::ios::app);

    if (g_logFile.is_open()) {
        g_logFile << "==== Cadence Log Started ====" << std::endl;

        // Always print the log path so devs/users know where to look
        std::string msg = "[" + nowTimestamp() + "][Logger] Writing logs to: " + logPath.string();
        std::cerr << msg << std::endl;
        g_logFile << msg << std::endl;
    } else {
        std::cerr << "[Logger] ERROR: Could not open log file: "
                  << logPath.string() << std::endl;
    }
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== Cadence Log Ended ====" << std::endl;
        g_logFile.close();
    }
}
