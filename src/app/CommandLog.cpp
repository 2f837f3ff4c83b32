#include "app/CommandLog.hpp"

#include <cstdlib>
#include <ctime>

namespace penenv::app {

std::string shell_single_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string prompt_command(const std::string& log_path) {
  std::string cmd =
    "history -a; "
    "__penenv_last_cmd=$(HISTTIMEFORMAT= history 1 | sed 's/^[ ]*[0-9]*[ ]*//'); "
    "if [ -z \"$__penenv_prev_cmd\" ]; then __penenv_prev_cmd=\"$__penenv_last_cmd\"; fi; "
    "if [ -n \"$__penenv_last_cmd\" ] && [ \"$__penenv_last_cmd\" != \"$__penenv_prev_cmd\" ]; then "
    "echo \"[$(date '+%Y-%m-%d %H:%M:%S')] $__penenv_last_cmd\" >> ";
  cmd += shell_single_quote(log_path);
  cmd += "; __penenv_prev_cmd=\"$__penenv_last_cmd\"; fi";
  return cmd;
}

static std::string env_or(EnvLookup env, const char* key, const char* def) {
  const char* v = env ? env(key) : nullptr;
  return std::string(key) + "=" + ((v && *v) ? v : def);
}

std::vector<std::string> shell_environment(EnvLookup env, bool global_logging, bool shell_logging,
                                           const std::string& log_path) {
  std::vector<std::string> out;
  if (global_logging && shell_logging) out.push_back("PROMPT_COMMAND=" + prompt_command(log_path));
  out.push_back(env_or(env, "HOME", "/tmp"));
  out.push_back(env_or(env, "USER", "user"));
  out.push_back(env_or(env, "PATH", "/usr/local/bin:/usr/bin:/bin"));
  out.push_back(env_or(env, "TERM", "xterm-256color"));
  out.push_back(env_or(env, "SHELL", "/bin/bash"));
  return out;
}

std::string timestamp_prefix(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "[%Y-%m-%d %H:%M:%S] ", &tm);
  return buf;
}

} // namespace penenv::app
