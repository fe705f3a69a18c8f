#pragma once

#include <cstdio>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/core.h>

/**
 * Log severity, ordered from most to least verbose.
 */
enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/**
 * Process-wide logger writing formatted lines to stderr.
 * Lines coming from different worker threads never interleave.
 */
class Log
{
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    static bool enabled(LogLevel level) { return level >= Log::level() && level != LogLevel::Off; }

    template <typename... Args>
    static void debug(fmt::format_string<Args...> format, Args &&...args)
    {
        write(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(fmt::format_string<Args...> format, Args &&...args)
    {
        write(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(fmt::format_string<Args...> format, Args &&...args)
    {
        write(LogLevel::Warning, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(fmt::format_string<Args...> format, Args &&...args)
    {
        write(LogLevel::Error, format, std::forward<Args>(args)...);
    }

private:
    template <typename... Args>
    static void write(LogLevel level, fmt::format_string<Args...> format, Args &&...args)
    {
        if (!enabled(level))
        {
            return;
        }
        emit(level, fmt::format(format, std::forward<Args>(args)...));
    }

    static void emit(LogLevel level, const std::string &message);
};
