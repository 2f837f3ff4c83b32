#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace penenv::app {

inline constexpr const char* kTargetsFile = "targets.txt";
inline constexpr const char* kNotesFile = "notes.md";
inline constexpr const char* kCommandLogFile = "commands.log";

// The project folder holding targets, notes and the command log.
class Workspace {
public:
  explicit Workspace(std::filesystem::path base_dir = ".") : base_(std::move(base_dir)) {}

  const std::filesystem::path& base_dir() const { return base_; }
  void set_base_dir(std::filesystem::path p) { base_ = std::move(p); }
  std::filesystem::path file_path(const std::string& name) const { return base_ / name; }

  std::filesystem::path targets_path() const { return file_path(kTargetsFile); }
  std::filesystem::path notes_path() const { return file_path(kNotesFile); }
  std::filesystem::path log_path() const { return file_path(kCommandLogFile); }

private:
  std::filesystem::path base_;
};

// $XDG_CONFIG_HOME/penenv or $HOME/.config/penenv, created when missing.
std::filesystem::path config_dir();
std::filesystem::path custom_commands_path();
std::filesystem::path settings_path();

// Non-blank lines not starting with '#', as written.
std::vector<std::string> load_targets(const std::filesystem::path& path);

std::optional<std::string> read_text(const std::filesystem::path& path);
bool write_text(const std::filesystem::path& path, const std::string& text, std::string& err);

} // namespace penenv::app
