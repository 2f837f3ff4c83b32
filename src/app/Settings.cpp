#include "app/Settings.hpp"
#include "util/AsciiLower.hpp"
#include "util/Log.hpp"
#include "util/YamlReader.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace penenv::app {

using penenv::util::YamlReader;

static const char* kMonitors = "monitor_visibility";
static const char* kShortcuts = "keyboard_shortcuts";

static bool resolve_bool(const YamlReader& y, const char* section, const char* key, bool def) {
  if (!y.has(section, key)) return def;
  return y.get_bool(section, key, def);
}

static std::string resolve_key(const YamlReader& y, const char* key, const std::string& def) {
  auto v = y.get_string(kShortcuts, key);
  return v.empty() ? def : v;
}

static std::optional<std::string> resolve_optional_key(const YamlReader& y, const char* key,
                                                       const std::optional<std::string>& def) {
  if (!y.has(kShortcuts, key)) return def;
  if (y.is_null(kShortcuts, key)) return std::nullopt;
  auto v = y.get_string(kShortcuts, key);
  if (v.empty()) return def;
  return v;
}

static std::optional<double> resolve_scale(const YamlReader& y, const char* key,
                                           const std::optional<double>& def) {
  if (!y.has("", key)) return def;
  if (y.is_null("", key)) return std::nullopt;
  double v = y.get_double("", key, -1.0);
  if (v <= 0.0) return def;
  return v;
}

AppSettings load_settings(const std::string& path) {
  AppSettings s{};
  YamlReader y;
  if (!y.load(path)) {
    PENENV_LOG_DEBUG("settings: %s not readable, using defaults", path.c_str());
    return s;
  }
  s.monitor_visibility.show_cpu = resolve_bool(y, kMonitors, "show_cpu", s.monitor_visibility.show_cpu);
  s.monitor_visibility.show_ram = resolve_bool(y, kMonitors, "show_ram", s.monitor_visibility.show_ram);
  s.monitor_visibility.show_network = resolve_bool(y, kMonitors, "show_network", s.monitor_visibility.show_network);

  auto& k = s.keyboard_shortcuts;
  k.toggle_drawer = resolve_key(y, "toggle_drawer", k.toggle_drawer);
  k.insert_target = resolve_key(y, "insert_target", k.insert_target);
  k.insert_timestamp = resolve_key(y, "insert_timestamp", k.insert_timestamp);
  k.new_shell = resolve_optional_key(y, "new_shell", k.new_shell);
  k.new_split = resolve_optional_key(y, "new_split", k.new_split);

  if (y.has("", "enable_command_logging"))
    s.enable_command_logging = y.get_bool("", "enable_command_logging", s.enable_command_logging);
  s.text_zoom_scale = resolve_scale(y, "text_zoom_scale", s.text_zoom_scale);
  s.terminal_zoom_scale = resolve_scale(y, "terminal_zoom_scale", s.terminal_zoom_scale);
  auto lines = y.get_int("", "terminal_scrollback_lines", s.terminal_scrollback_lines);
  if (lines >= 0) s.terminal_scrollback_lines = lines;
  return s;
}

bool save_settings(const std::string& path, const AppSettings& s, std::string& err) {
  YamlReader y;
  y.set(kMonitors, "show_cpu", s.monitor_visibility.show_cpu);
  y.set(kMonitors, "show_ram", s.monitor_visibility.show_ram);
  y.set(kMonitors, "show_network", s.monitor_visibility.show_network);
  const auto& k = s.keyboard_shortcuts;
  y.set(kShortcuts, "toggle_drawer", k.toggle_drawer);
  y.set(kShortcuts, "insert_target", k.insert_target);
  y.set(kShortcuts, "insert_timestamp", k.insert_timestamp);
  if (k.new_shell) y.set(kShortcuts, "new_shell", *k.new_shell);
  else y.set_null(kShortcuts, "new_shell");
  if (k.new_split) y.set(kShortcuts, "new_split", *k.new_split);
  else y.set_null(kShortcuts, "new_split");
  y.set("", "enable_command_logging", s.enable_command_logging);
  if (s.text_zoom_scale) y.set("", "text_zoom_scale", *s.text_zoom_scale);
  else y.set_null("", "text_zoom_scale");
  if (s.terminal_zoom_scale) y.set("", "terminal_zoom_scale", *s.terminal_zoom_scale);
  else y.set_null("", "terminal_zoom_scale");
  y.set("", "terminal_scrollback_lines", s.terminal_scrollback_lines);

  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  errno = 0;
  if (!y.save(path)) {
    err = std::string("Failed to write settings config: ") +
          (errno ? std::strerror(errno) : "write error");
    return false;
  }
  return true;
}

double clamp_zoom(double v) { return std::clamp(v, zoom::kMinScale, zoom::kMaxScale); }
double zoom_in(double v) { return clamp_zoom(v * zoom::kStep); }
double zoom_out(double v) { return clamp_zoom(v / zoom::kStep); }

std::string key_to_display(const std::string& key) {
  if (key == "grave") return "`";
  if (key == "t") return "T";
  if (key == "Return") return "Enter";
  if (key == "space") return "Space";
  return penenv::util::ascii_upper(key);
}

std::optional<std::string> captured_shortcut_key(std::string_view key_name, bool shift_held, bool shift_required) {
  if (key_name.empty() || shift_held != shift_required) return std::nullopt;
  // single letters are stored the way the defaults spell them
  if (key_name.size() == 1 && std::isalpha(static_cast<unsigned char>(key_name[0])))
    return shift_required ? penenv::util::ascii_upper(key_name) : penenv::util::ascii_lower(key_name);
  return std::string(key_name);
}

SettingsStore& SettingsStore::instance() {
  static SettingsStore store;
  return store;
}

void SettingsStore::load(const std::string& path) {
  auto s = load_settings(path);
  std::lock_guard<std::mutex> lk(mu_);
  path_ = path;
  settings_ = s;
  text_zoom_ = clamp_zoom(s.text_zoom_scale.value_or(zoom::kDefaultScale));
  terminal_zoom_ = clamp_zoom(s.terminal_zoom_scale.value_or(zoom::kDefaultScale));
}

bool SettingsStore::save(std::string& err) {
  AppSettings copy;
  std::string path;
  {
    std::lock_guard<std::mutex> lk(mu_);
    copy = settings_;
    path = path_;
  }
  if (path.empty()) { err = "Failed to write settings config: no settings path"; return false; }
  return save_settings(path, copy, err);
}

AppSettings SettingsStore::get() const {
  std::lock_guard<std::mutex> lk(mu_);
  return settings_;
}

bool SettingsStore::update(const AppSettings& s, std::string& err) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    settings_ = s;
  }
  return save(err);
}

double SettingsStore::text_zoom() const {
  std::lock_guard<std::mutex> lk(mu_);
  return text_zoom_;
}

double SettingsStore::terminal_zoom() const {
  std::lock_guard<std::mutex> lk(mu_);
  return terminal_zoom_;
}

void SettingsStore::set_text_zoom(double v) {
  std::lock_guard<std::mutex> lk(mu_);
  text_zoom_ = clamp_zoom(v);
  settings_.text_zoom_scale = text_zoom_;
}

void SettingsStore::set_terminal_zoom(double v) {
  std::lock_guard<std::mutex> lk(mu_);
  terminal_zoom_ = clamp_zoom(v);
  settings_.terminal_zoom_scale = terminal_zoom_;
}

bool SettingsStore::command_logging_enabled() const {
  std::lock_guard<std::mutex> lk(mu_);
  return settings_.enable_command_logging;
}

KeyboardShortcuts SettingsStore::shortcuts() const {
  std::lock_guard<std::mutex> lk(mu_);
  return settings_.keyboard_shortcuts;
}

} // namespace penenv::app
