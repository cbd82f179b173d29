#include "logger.hpp"

#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <sstream>
#include <thread>
#include <fstream>
#include <mutex>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <cctype>

// =====================================================
// Globals
// =====================================================
static std::mutex g_logMutex;
static PhaseInfo g_phaseInfo{};

static LogLevel g_minLevel = LogLevel::Phase;
static bool g_console = true;

// Buffer for grouped phase logging
static bool g_buffering = false;
static std::vector<std::string> g_phaseBuffer;

// File output stream
static std::ofstream g_logFile;

// =====================================================
// Helpers
// =====================================================
// HH:MM:SS.mmm local time
static std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
    using namespace std::chrono;
    auto secs = time_point_cast<seconds>(tp);
    auto ms = duration_cast<milliseconds>(tp - secs).count();

    std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03lld", static_cast<long long>(ms));
    return buf;
}

static std::string nowTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

// Low 16 bits of the thread id hash
static std::string threadTag() {
    std::ostringstream oss;
    oss << std::hex << (std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffff);
    return oss.str();
}

static std::string basename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return (pos == std::string::npos) ? path : path.substr(pos + 1);
}

// Caller holds g_logMutex
static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << std::endl;
    }

    // stdout belongs to the transcript console, logs go to stderr
    if (g_console) {
        std::cerr << line << std::endl;
    }
}

static void writeLevel(LogLevel level, const char* label,
                       const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level < g_minLevel) return;
    writeLine(nowTimestamp() + " " + label + " t" + threadTag() + " [" + tag + "] " + msg);
}

LogLevel parseLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "warn")  return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    return LogLevel::Phase;
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

    // Failed phases bypass the level filter
    if (success && LogLevel::Phase < g_minLevel) return;

    std::string entry = formatTimestamp(g_phaseInfo.timestamp) + " PHASE t" + threadTag() +
                        " [" + g_phaseInfo.fileName + "] " + g_phaseInfo.phaseName +
                        (g_phaseInfo.success ? " ... ok" : " ... FAILED");

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
    writeLevel(LogLevel::Debug, "DEBUG", tag, msg);
}

void logTrace(const std::string& tag, const std::string& msg) {
    writeLevel(LogLevel::Trace, "TRACE", tag, msg);
}

void logWarn(const std::string& tag, const std::string& msg) {
    writeLevel(LogLevel::Warn, "WARN", tag, msg);
}

void logError(const std::string& tag, const std::string& msg) {
    writeLevel(LogLevel::Error, "ERROR", tag, msg);
}

// =====================================================
// Lifecycle
// =====================================================
namespace fs = std::filesystem;

void initLogger(const std::string& filename, LogLevel minLevel, bool console) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    g_minLevel = minLevel;
    g_console  = console;

    if (g_logFile.is_open()) {
        g_logFile.close();
    }
    if (filename.empty()) {
        return;
    }

    fs::path logPath = fs::absolute(filename);
    g_logFile.open(logPath, std::ios::out | std::ios::app);

    if (g_logFile.is_open()) {
        g_logFile << "==== intervox log started ====" << std::endl;

        std::string msg = nowTimestamp() + " Logger writing to " + logPath.string();
        if (g_console) std::cerr << msg << std::endl;
        g_logFile << msg << std::endl;
    } else {
        std::cerr << "[Logger] ERROR: Could not open log file: "
                  << logPath.string() << std::endl;
    }
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== intervox log ended ====" << std::endl;
        g_logFile.close();
    }
}
