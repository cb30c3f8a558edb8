#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Accepts "debug", "info", "warn" and "error".
bool parse_log_level(const std::string &name, LogLevel &level);

// Writes one timestamped line to stderr.
void log_message(LogLevel level, const std::string &message);

inline void log_debug(const std::string &message) { log_message(LogLevel::Debug, message); }
inline void log_info(const std::string &message) { log_message(LogLevel::Info, message); }
inline void log_warn(const std::string &message) { log_message(LogLevel::Warn, message); }
inline void log_error(const std::string &message) { log_message(LogLevel::Error, message); }

#endif
