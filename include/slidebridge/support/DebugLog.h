#pragma once
// =============================================================================
// SlideBridge - DebugLog
// "SlideBridge: " prefixed debug output. OutputDebugStringW on Windows,
// stderr elsewhere. Callable from any thread.
// =============================================================================

#include <functional>
#include <string>

namespace SlideBridge
{

enum class LogLevel : int
{
    Debug = 0,
    Warning = 1,
    Error = 2,
};

void logMessage(LogLevel level, const std::string& message);

inline void logDebug(const std::string& message) { logMessage(LogLevel::Debug, message); }
inline void logWarning(const std::string& message) { logMessage(LogLevel::Warning, message); }
inline void logError(const std::string& message) { logMessage(LogLevel::Error, message); }

// Messages below this level are dropped. Default: Warning.
void setMinimumLogLevel(LogLevel level);

// Replaces the platform writer (tests capture lines here). Empty restores it.
using LogSink = std::function<void(LogLevel, const std::string&)>;
void setLogSink(LogSink sink);

} // namespace SlideBridge
