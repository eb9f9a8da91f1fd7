#pragma once
#include <string>
#include <chrono>

// =====================================================
// Log Level
// =====================================================
enum class LogLevel {
    Trace,
    Debug,
    Error
};

// Minimum level written (phase lines are always written)
extern LogLevel g_logLevel;

// Parse "trace" / "debug" / "error" (anything else -> Debug)
LogLevel parseLogLevel(const std::string& name);
void setLogLevel(LogLevel level);

// =====================================================
// Phase Info Struct
// =====================================================
struct PhaseInfo {
    std::chrono::system_clock::time_point timestamp; // when entered
    std::string fileName;    // file containing this phase
    std::string phaseName;   // descriptive phase string
    bool success;            // true = success, false = failure
};

// Most recent phase
extern PhaseInfo g_phaseInfo;

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
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
