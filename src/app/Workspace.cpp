#include "app/Workspace.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string_view>

namespace penenv::app {

namespace fs = std::filesystem;

fs::path config_dir() {
  fs::path base;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) base = xdg;
  else if (const char* home = std::getenv("HOME"); home && *home) base = fs::path(home) / ".config";
  else base = ".config";
  fs::path dir = base / "penenv";
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) PENENV_LOG_WARN("cannot create config dir %s: %s", dir.c_str(), ec.message().c_str());
  return dir;
}

fs::path custom_commands_path() { return config_dir() / "custom_commands.yaml"; }
fs::path settings_path() { return config_dir() / "settings.yaml"; }

std::vector<std::string> load_targets(const fs::path& path) {
  std::vector<std::string> out;
  auto text = read_text(path);
  if (!text) return out;
  penenv::util::for_each_line(*text, [&](std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    auto first = line.find_first_not_of(" \t");
    if (first == std::string_view::npos) return;
    if (line[first] == '#') return;
    out.emplace_back(line);
  });
  return out;
}

std::optional<std::string> read_text(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) return std::nullopt;
  std::stringstream ss;
  ss << in.rdbuf();
  if (in.bad()) return std::nullopt;
  return ss.str();
}

bool write_text(const fs::path& path, const std::string& text, std::string& err) {
  errno = 0;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    err = "cannot open " + path.string() + ": " + (errno ? std::strerror(errno) : "unknown error");
    return false;
  }
  out << text;
  out.flush();
  if (!out.good()) {
    err = "write failed for " + path.string();
    return false;
  }
  return true;
}

} // namespace penenv::app
