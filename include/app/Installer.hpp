#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace penenv::app {

struct InstallOptions {
  std::filesystem::path source_dir{"."};  // data/ and images/ live here
  std::filesystem::path binary{"build/penenv"};
  std::filesystem::path home;             // default $HOME
  const char* path_env{nullptr};          // PATH for tool lookup and the hint
};

struct InstallReport {
  std::vector<std::filesystem::path> installed;
  std::filesystem::path bin_dir;
  bool desktop_db_updated{false};
  bool icon_cache_updated{false};
  bool bin_dir_on_path{false};
};

// Copy binary, icons and desktop entry under <home>/.local. Existing files
// are overwritten, so running it twice is harmless.
bool install_local(const InstallOptions& opts, InstallReport& report, std::string& err);

// True when dir is one of the entries of the colon-separated path list.
bool dir_on_path(const std::filesystem::path& dir, const char* path_env);

} // namespace penenv::app
