#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace penenv::util {

// Search $PATH (or path_env when given) for an executable regular file.
std::optional<std::filesystem::path> find_executable(std::string_view name,
                                                     const char* path_env = nullptr);

// Run argv[0] (looked up on PATH) with the given arguments and wait for it.
// Returns the exit status, 128+signal when killed, or -1 when it could not be
// started. stdout/stderr are inherited unless quiet is set.
int run_process(const std::vector<std::string>& argv,
                const std::filesystem::path& cwd = {},
                bool quiet = false);

// Joined argv for log messages
std::string describe_command(const std::vector<std::string>& argv);

// uname machine string, e.g. "x86_64"
std::string host_machine();

} // namespace penenv::util
