#pragma once
#include <string>
#include <memory>

enum class LogLevel { Debug, Info, Warning, Error };

const char* LogLevelName(LogLevel level);

// Parses "debug", "info", "warning"/"warn", "error" (case-insensitive).
bool ParseLogLevel(const std::string& text, LogLevel& out);

class ILogSink
{
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, const std::string& tag, const std::string& message) = 0;
};

// Process-wide log facade. Safe to call from worker threads.
class DebugLog
{
public:
    static void SetSink(std::shared_ptr<ILogSink> sink);   // nullptr restores stderr
    static void SetMinLevel(LogLevel level);
    static LogLevel GetMinLevel();

    static void Write(LogLevel level, const std::string& tag, const std::string& message);

    static void Debug(const std::string& tag, const std::string& message)   { Write(LogLevel::Debug, tag, message); }
    static void Info(const std::string& tag, const std::string& message)    { Write(LogLevel::Info, tag, message); }
    static void Warning(const std::string& tag, const std::string& message) { Write(LogLevel::Warning, tag, message); }
    static void Error(const std::string& tag, const std::string& message)   { Write(LogLevel::Error, tag, message); }
};
