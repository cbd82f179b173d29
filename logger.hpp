#pragma once
#include <string>
#include <chrono>

// =====================================================
// Log Level
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Phase,
    Warn,
    Error
};

// Parse "trace" / "debug" / "phase" / "warn" / "error" (falls back to Phase)
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

// Most recent phase (read by the driver when reporting)
PhaseInfo lastPhase();

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename,
                LogLevel minLevel = LogLevel::Phase,
                bool console = true);
void shutdownLogger();

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
