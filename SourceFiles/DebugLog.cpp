#include "DebugLog.h"
#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>

namespace {

class StderrSink : public ILogSink
{
public:
    void Write(LogLevel level, const std::string& tag, const std::string& message) override
    {
        std::fprintf(stderr, "[%s] %s: %s\n", LogLevelName(level), tag.c_str(), message.c_str());
    }
};

std::mutex g_logMutex;
std::shared_ptr<ILogSink> g_sink;
std::atomic<int> g_minLevel{ static_cast<int>(LogLevel::Info) };

} // anonymous namespace

const char* LogLevelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:   return "debug";
    case LogLevel::Info:    return "info";
    case LogLevel::Warning: return "warning";
    case LogLevel::Error:   return "error";
    default:                return "?";
    }
}

bool ParseLogLevel(const std::string& text, LogLevel& out)
{
    std::string lower = text;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "debug")                        { out = LogLevel::Debug;   return true; }
    if (lower == "info")                         { out = LogLevel::Info;    return true; }
    if (lower == "warning" || lower == "warn")   { out = LogLevel::Warning; return true; }
    if (lower == "error")                        { out = LogLevel::Error;   return true; }
    return false;
}

void DebugLog::SetSink(std::shared_ptr<ILogSink> sink)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sink = std::move(sink);
}

void DebugLog::SetMinLevel(LogLevel level)
{
    g_minLevel.store(static_cast<int>(level));
}

LogLevel DebugLog::GetMinLevel()
{
    return static_cast<LogLevel>(g_minLevel.load());
}

void DebugLog::Write(LogLevel level, const std::string& tag, const std::string& message)
{
    if (static_cast<int>(level) < g_minLevel.load()) return;

    static StderrSink s_stderrSink;

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_sink)
        g_sink->Write(level, tag, message);
    else
        s_stderrSink.Write(level, tag, message);
}
