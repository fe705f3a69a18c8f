#include "log.hpp"

#include <atomic>

namespace
{
    std::atomic<LogLevel> currentLevel{LogLevel::Warning};
    std::mutex outputMutex;

    const char *levelTag(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warning:
            return "warning";
        case LogLevel::Error:
            return "error";
        default:
            return "";
        }
    }
}

void Log::setLevel(LogLevel level)
{
    currentLevel.store(level);
}

LogLevel Log::level()
{
    return currentLevel.load();
}

void Log::emit(LogLevel level, const std::string &message)
{
    std::lock_guard<std::mutex> lock(outputMutex);
    fmt::print(stderr, "[{}] {}\n", levelTag(level), message);
    std::fflush(stderr);
}
