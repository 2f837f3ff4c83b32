#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace penenv::app {

// Bash PROMPT_COMMAND that appends each new history entry to log_path as
// "[YYYY-MM-DD HH:MM:SS] <command>", skipping a repeat of the previous entry.
std::string prompt_command(const std::string& log_path);

// Quote s for a POSIX shell with single quotes.
std::string shell_single_quote(const std::string& s);

// Lookup used for HOME, USER, PATH, TERM and SHELL; nullptr when unset.
using EnvLookup = const char* (*)(const char*);

// "KEY=value" entries for the shell child. PROMPT_COMMAND comes first when
// logging is on both globally and for this shell.
std::vector<std::string> shell_environment(EnvLookup env, bool global_logging, bool shell_logging,
                                           const std::string& log_path);

// "[YYYY-MM-DD HH:MM:SS] " in local time
std::string timestamp_prefix(std::chrono::system_clock::time_point tp);

} // namespace penenv::app
