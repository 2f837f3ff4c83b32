#include "minitest.hpp"
#include "app/CommandLog.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <string>

using namespace penenv::app;

static const char* fake_env(const char* key) {
  std::string k(key);
  if (k == "HOME") return "/home/tester";
  if (k == "PATH") return "/opt/bin:/usr/bin";
  if (k == "TERM") return "";
  return nullptr;
}

static bool has_entry(const std::vector<std::string>& env, const std::string& e) {
  for (const auto& x : env) if (x == e) return true;
  return false;
}

TEST(log_single_quote_escapes_quotes) {
  ASSERT_EQ(shell_single_quote("plain"), std::string("'plain'"));
  ASSERT_EQ(shell_single_quote("it's"), std::string("'it'\\''s'"));
  ASSERT_EQ(shell_single_quote(""), std::string("''"));
}

TEST(log_prompt_command_targets_log_path) {
  auto pc = prompt_command("/work/my dir/commands.log");
  ASSERT_TRUE(pc.rfind("history -a; ", 0) == 0);
  ASSERT_TRUE(pc.find(">> '/work/my dir/commands.log'") != std::string::npos);
  ASSERT_TRUE(pc.find("%Y-%m-%d %H:%M:%S") != std::string::npos);
}

TEST(log_environment_with_logging) {
  auto env = shell_environment(fake_env, true, true, "/w/commands.log");
  ASSERT_EQ(env.size(), 6u);
  ASSERT_TRUE(env[0].rfind("PROMPT_COMMAND=", 0) == 0);
  ASSERT_TRUE(has_entry(env, "HOME=/home/tester"));
  ASSERT_TRUE(has_entry(env, "USER=user"));
  ASSERT_TRUE(has_entry(env, "PATH=/opt/bin:/usr/bin"));
  ASSERT_TRUE(has_entry(env, "TERM=xterm-256color"));
  ASSERT_TRUE(has_entry(env, "SHELL=/bin/bash"));
}

TEST(log_environment_without_logging) {
  auto a = shell_environment(fake_env, false, true, "/w/commands.log");
  auto b = shell_environment(fake_env, true, false, "/w/commands.log");
  ASSERT_EQ(a.size(), 5u);
  ASSERT_EQ(b.size(), 5u);
  for (const auto& e : a) ASSERT_TRUE(e.rfind("PROMPT_COMMAND=", 0) != 0);
}

TEST(log_environment_null_lookup_uses_defaults) {
  auto env = shell_environment(nullptr, false, false, "");
  ASSERT_TRUE(has_entry(env, "HOME=/tmp"));
  ASSERT_TRUE(has_entry(env, "PATH=/usr/local/bin:/usr/bin:/bin"));
}

TEST(log_timestamp_prefix_format) {
  ::setenv("TZ", "UTC", 1);
  ::tzset();
  auto tp = std::chrono::system_clock::from_time_t(1700000000); // 2023-11-14 22:13:20 UTC
  ASSERT_EQ(timestamp_prefix(tp), std::string("[2023-11-14 22:13:20] "));
}
