#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace penenv::app {

namespace zoom {
inline constexpr double kMinScale = 0.5;
inline constexpr double kMaxScale = 3.0;
inline constexpr double kDefaultScale = 1.0;
inline constexpr double kStep = 1.1;
} // namespace zoom

struct MonitorVisibility {
  bool show_cpu{true};
  bool show_ram{true};
  bool show_network{true};
};

// Key names as GDK spells them (keyval names).
struct KeyboardShortcuts {
  std::string toggle_drawer{"grave"};
  std::string insert_target{"t"};
  std::string insert_timestamp{"T"};
  std::optional<std::string> new_shell{"N"};
  std::optional<std::string> new_split{"S"};
};

struct AppSettings {
  MonitorVisibility monitor_visibility{};
  KeyboardShortcuts keyboard_shortcuts{};
  bool enable_command_logging{true};
  std::optional<double> text_zoom_scale{zoom::kDefaultScale};
  std::optional<double> terminal_zoom_scale{zoom::kDefaultScale};
  int64_t terminal_scrollback_lines{10000};
};

// Missing file gives defaults; each present and valid key overrides its default.
AppSettings load_settings(const std::string& path);
bool save_settings(const std::string& path, const AppSettings& settings, std::string& err);

double clamp_zoom(double v);
double zoom_in(double v);
double zoom_out(double v);

// Human-readable label for a key name ("grave" -> "`").
std::string key_to_display(const std::string& key);

// Key name to store for a Ctrl combination captured for a shortcut. nullopt
// when the Shift state differs from the one the shortcut is matched with.
std::optional<std::string> captured_shortcut_key(std::string_view key_name, bool shift_held, bool shift_required);

// Process-wide current settings and live zoom scales.
class SettingsStore {
public:
  static SettingsStore& instance();

  // Load from path and remember it for save().
  void load(const std::string& path);
  bool save(std::string& err);

  AppSettings get() const;
  // Replace and persist
  bool update(const AppSettings& s, std::string& err);

  double text_zoom() const;
  double terminal_zoom() const;
  void set_text_zoom(double v);
  void set_terminal_zoom(double v);

  bool command_logging_enabled() const;
  KeyboardShortcuts shortcuts() const;

private:
  SettingsStore() = default;
  mutable std::mutex mu_;
  std::string path_;
  AppSettings settings_{};
  double text_zoom_{zoom::kDefaultScale};
  double terminal_zoom_{zoom::kDefaultScale};
};

} // namespace penenv::app
