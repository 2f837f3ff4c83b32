#pragma once

#include <string_view>

namespace penenv::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Threshold is read once from PENENV_LOG (debug|info|warn|error), default warn.
LogLevel log_threshold();
void set_log_threshold(LogLevel level);
LogLevel parse_log_level(std::string_view s, LogLevel def);

// All log lines go to stderr as "penenv: <level>: <message>".
void log_message(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace penenv::util

#define PENENV_LOG_DEBUG(...) ::penenv::util::log_message(::penenv::util::LogLevel::Debug, __VA_ARGS__)
#define PENENV_LOG_INFO(...)  ::penenv::util::log_message(::penenv::util::LogLevel::Info, __VA_ARGS__)
#define PENENV_LOG_WARN(...)  ::penenv::util::log_message(::penenv::util::LogLevel::Warn, __VA_ARGS__)
#define PENENV_LOG_ERROR(...) ::penenv::util::log_message(::penenv::util::LogLevel::Error, __VA_ARGS__)
