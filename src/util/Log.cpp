#include "util/Log.hpp"
#include "util/AsciiLower.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace penenv::util {

static std::atomic<int> g_threshold{-1};

LogLevel parse_log_level(std::string_view s, LogLevel def) {
  std::string v = ascii_lower(s);
  if (v == "debug" || v == "trace") return LogLevel::Debug;
  if (v == "info") return LogLevel::Info;
  if (v == "warn" || v == "warning") return LogLevel::Warn;
  if (v == "error") return LogLevel::Error;
  return def;
}

LogLevel log_threshold() {
  int t = g_threshold.load(std::memory_order_relaxed);
  if (t < 0) {
    const char* env = std::getenv("PENENV_LOG");
    LogLevel lvl = (env && *env) ? parse_log_level(env, LogLevel::Warn) : LogLevel::Warn;
    t = static_cast<int>(lvl);
    g_threshold.store(t, std::memory_order_relaxed);
  }
  return static_cast<LogLevel>(t);
}

void set_log_threshold(LogLevel level) {
  g_threshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

static const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warning";
    case LogLevel::Error: return "error";
  }
  return "?";
}

void log_message(LogLevel level, const char* fmt, ...) {
  if (static_cast<int>(level) < static_cast<int>(log_threshold())) return;
  char buf[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  std::fprintf(stderr, "penenv: %s: %s\n", level_name(level), buf);
}

} // namespace penenv::util
