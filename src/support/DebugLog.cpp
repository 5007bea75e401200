// =============================================================================
// SlideBridge - DebugLog
// Prefixed debug output. Same channel the debugger and DebugView read on
// Windows; stderr on other platforms.
// =============================================================================

#include "slidebridge/support/DebugLog.h"

#include <atomic>
#include <mutex>

#ifdef _WIN32
#ifndef UNICODE
#define UNICODE
#endif
#ifndef _UNICODE
#define _UNICODE
#endif
#include <windows.h>
#else
#include <cstdio>
#endif

namespace SlideBridge
{

static std::atomic<int> s_minimumLevel{static_cast<int>(LogLevel::Warning)};
static std::mutex s_sinkMutex;
static LogSink s_sink;

static const char* levelTag(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:   return "";
    case LogLevel::Warning: return "warning: ";
    case LogLevel::Error:   return "error: ";
    }
    return "";
}

static void writePlatform(const std::string& line)
{
#ifdef _WIN32
    int len = MultiByteToWideChar(CP_UTF8, 0, line.c_str(), -1, nullptr, 0);
    if (len <= 0)
    {
        OutputDebugStringA(line.c_str());
        return;
    }
    std::wstring wide(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, line.c_str(), -1, &wide[0], len);
    OutputDebugStringW(wide.c_str());
#else
    std::fputs(line.c_str(), stderr);
#endif
}

void logMessage(LogLevel level, const std::string& message)
{
    if (static_cast<int>(level) < s_minimumLevel.load(std::memory_order_relaxed))
        return;

    std::lock_guard<std::mutex> lock(s_sinkMutex);
    if (s_sink)
    {
        s_sink(level, message);
        return;
    }
    writePlatform("SlideBridge: " + std::string(levelTag(level)) + message + "\n");
}

void setMinimumLogLevel(LogLevel level)
{
    s_minimumLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

void setLogSink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(s_sinkMutex);
    s_sink = std::move(sink);
}

} // namespace SlideBridge
