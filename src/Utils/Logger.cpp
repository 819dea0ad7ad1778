// src/Utils/Logger.cpp

#include "Utils/Logger.h"
#include "Utils/StringUtils.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <cstdio>
#include <cstdlib>

struct Logger::Impl {
    std::mutex      mutex;
    std::ofstream   file;
    LogLevel        level = LogLevel::Info;
    bool            toConsole = true;
};

std::unique_ptr<Logger::Impl> Logger::s_impl = nullptr;

void Logger::Initialize(const std::string& logFilePath, bool echoToConsole) {
    s_impl = std::make_unique<Impl>();
    if (!logFilePath.empty()) {
        s_impl->file.open(logFilePath, std::ios::app);
        s_impl->toConsole = echoToConsole || !s_impl->file.is_open();
        if (!s_impl->file.is_open()) {
            std::cerr << "Logger: cannot open " << logFilePath << ", using stdout" << std::endl;
        }
    }
}

void Logger::Shutdown() {
    if (s_impl && s_impl->file.is_open()) {
        s_impl->file.flush();
        s_impl->file.close();
    }
    s_impl.reset();
}

void Logger::SetLevel(LogLevel level) {
    if (s_impl) {
        s_impl->level = level;
    }
}

LogLevel Logger::GetLevel() {
    return s_impl ? s_impl->level : LogLevel::Info;
}

LogLevel Logger::ParseLevel(const std::string& name) {
    std::string upper = StringUtils::ToUpper(StringUtils::Trim(name));
    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    return LogLevel::Info;
}

bool Logger::Enabled(LogLevel level) {
    return s_impl && s_impl->level <= level;
}

void Logger::Log(LogLevel level, const char* fmt, ...) {
    if (!Enabled(level)) return;
    va_list args;
    va_start(args, fmt);
    LogV(level, fmt, args);
    va_end(args);
}

void Logger::Trace(const char* fmt, ...) {
    if (!Enabled(LogLevel::Trace)) return;
    va_list args; va_start(args, fmt);
    LogV(LogLevel::Trace, fmt, args);
    va_end(args);
}

void Logger::Debug(const char* fmt, ...) {
    if (!Enabled(LogLevel::Debug)) return;
    va_list args; va_start(args, fmt);
    LogV(LogLevel::Debug, fmt, args);
    va_end(args);
}

void Logger::Info(const char* fmt, ...) {
    if (!Enabled(LogLevel::Info)) return;
    va_list args; va_start(args, fmt);
    LogV(LogLevel::Info, fmt, args);
    va_end(args);
}

void Logger::Warn(const char* fmt, ...) {
    if (!Enabled(LogLevel::Warn)) return;
    va_list args; va_start(args, fmt);
    LogV(LogLevel::Warn, fmt, args);
    va_end(args);
}

void Logger::Error(const char* fmt, ...) {
    if (!Enabled(LogLevel::Error)) return;
    va_list args; va_start(args, fmt);
    LogV(LogLevel::Error, fmt, args);
    va_end(args);
}

void Logger::Fatal(const char* fmt, ...) {
    if (s_impl) {
        va_list args; va_start(args, fmt);
        LogV(LogLevel::Fatal, fmt, args);
        va_end(args);
        Shutdown();
        std::abort();
    }
}

void Logger::LogV(LogLevel level, const char* fmt, va_list args) {
    if (!s_impl) return;
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm;
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream header;
    header << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << ms
           << " [" << LevelToString(level) << "] ";

    constexpr size_t BUFFER_SIZE = 1024;
    char buffer[BUFFER_SIZE];
    vsnprintf(buffer, BUFFER_SIZE, fmt, args);

    std::lock_guard<std::mutex> lock(s_impl->mutex);
    if (s_impl->file.is_open()) {
        s_impl->file << header.str() << buffer << '\n';
        if (level >= LogLevel::Error) s_impl->file.flush();
    }
    if (s_impl->toConsole) {
        std::cout << header.str() << buffer << std::endl;
    }
}

const char* Logger::LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        default:              return "UNKNOWN";
    }
}
