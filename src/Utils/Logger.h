// src/Utils/Logger.h

#pragma once

#include <string>
#include <cstdarg>
#include <memory>

// Logging levels
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

class Logger {
public:
    // Open the sink. Empty path logs to stdout only.
    static void Initialize(const std::string& logFilePath = "", bool echoToConsole = false);

    // Flush and close the sink. Logging calls after this are no-ops.
    static void Shutdown();

    static void SetLevel(LogLevel level);
    static LogLevel GetLevel();

    // "TRACE", "debug", "Warn"... unknown names map to Info
    static LogLevel ParseLevel(const std::string& name);

    static void Log(LogLevel level, const char* fmt, ...);

    static void Trace(const char* fmt, ...);
    static void Debug(const char* fmt, ...);
    static void Info(const char* fmt, ...);
    static void Warn(const char* fmt, ...);
    static void Error(const char* fmt, ...);
    static void Fatal(const char* fmt, ...);

private:
    struct Impl;
    static std::unique_ptr<Impl> s_impl;

    static bool Enabled(LogLevel level);
    static void LogV(LogLevel level, const char* fmt, va_list args);
    static const char* LevelToString(LogLevel level);
};
