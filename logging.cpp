#include "logging.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace
{

std::atomic<LogLevel> min_level{LogLevel::Info};
std::mutex output_mutex;

const char *level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "?";
}

} // namespace

void set_log_level(LogLevel level)
{
    min_level = level;
}

LogLevel get_log_level()
{
    return min_level;
}

bool parse_log_level(const std::string &name, LogLevel &level)
{
    if (name == "debug")
        level = LogLevel::Debug;
    else if (name == "info")
        level = LogLevel::Info;
    else if (name == "warn")
        level = LogLevel::Warn;
    else if (name == "error")
        level = LogLevel::Error;
    else
        return false;
    return true;
}

void log_message(LogLevel level, const std::string &message)
{
    if (level < min_level)
        return;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc;
    gmtime_r(&now, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &utc);

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << stamp << " " << level_name(level) << " " << message << std::endl;
}
