#include "minitest.hpp"
#include "util/Log.hpp"
#include <cstdlib>

using namespace penenv::util;

TEST(log_parse_levels) {
  ASSERT_TRUE(parse_log_level("debug", LogLevel::Warn) == LogLevel::Debug);
  ASSERT_TRUE(parse_log_level("TRACE", LogLevel::Warn) == LogLevel::Debug);
  ASSERT_TRUE(parse_log_level("Info", LogLevel::Warn) == LogLevel::Info);
  ASSERT_TRUE(parse_log_level("warning", LogLevel::Error) == LogLevel::Warn);
  ASSERT_TRUE(parse_log_level("error", LogLevel::Warn) == LogLevel::Error);
  ASSERT_TRUE(parse_log_level("loud", LogLevel::Info) == LogLevel::Info);
  ASSERT_TRUE(parse_log_level("", LogLevel::Error) == LogLevel::Error);
}

TEST(log_threshold_from_environment) {
  ::setenv("PENENV_LOG", "error", 1);
  // first query reads the environment
  ASSERT_TRUE(log_threshold() == LogLevel::Error);
  ::setenv("PENENV_LOG", "debug", 1);
  ASSERT_TRUE(log_threshold() == LogLevel::Error);
  set_log_threshold(LogLevel::Info);
  ASSERT_TRUE(log_threshold() == LogLevel::Info);
  PENENV_LOG_DEBUG("suppressed %d", 1);
  PENENV_LOG_INFO("shown %s", "once");
}
