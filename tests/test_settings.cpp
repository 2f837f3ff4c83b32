#include "minitest.hpp"
#include "app/Settings.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace penenv::app;

static fs::path make_dir(const char* tag) {
  auto dir = fs::temp_directory_path() / (std::string("penenv_test_settings_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static void write_file(const fs::path& p, const std::string& text) {
  std::ofstream(p) << text;
}

TEST(settings_missing_file_gives_defaults) {
  auto dir = make_dir("missing");
  AppSettings s = load_settings((dir / "settings.yaml").string());
  ASSERT_TRUE(s.monitor_visibility.show_cpu);
  ASSERT_TRUE(s.monitor_visibility.show_ram);
  ASSERT_TRUE(s.monitor_visibility.show_network);
  ASSERT_EQ(s.keyboard_shortcuts.toggle_drawer, std::string("grave"));
  ASSERT_EQ(s.keyboard_shortcuts.insert_target, std::string("t"));
  ASSERT_EQ(s.keyboard_shortcuts.insert_timestamp, std::string("T"));
  ASSERT_TRUE(s.keyboard_shortcuts.new_shell == std::optional<std::string>("N"));
  ASSERT_TRUE(s.keyboard_shortcuts.new_split == std::optional<std::string>("S"));
  ASSERT_TRUE(s.enable_command_logging);
  ASSERT_TRUE(s.text_zoom_scale.has_value());
  ASSERT_NEAR(*s.text_zoom_scale, 1.0, 1e-12);
  ASSERT_EQ(s.terminal_scrollback_lines, 10000);
}

TEST(settings_partial_file_keeps_other_defaults) {
  auto dir = make_dir("partial");
  auto path = dir / "settings.yaml";
  write_file(path,
    "monitor_visibility:\n"
    "  show_ram: false\n"
    "terminal_scrollback_lines: 2500\n");
  AppSettings s = load_settings(path.string());
  ASSERT_TRUE(s.monitor_visibility.show_cpu);
  ASSERT_TRUE(!s.monitor_visibility.show_ram);
  ASSERT_EQ(s.terminal_scrollback_lines, 2500);
  ASSERT_EQ(s.keyboard_shortcuts.toggle_drawer, std::string("grave"));
  ASSERT_TRUE(s.enable_command_logging);
}

TEST(settings_null_clears_optional_shortcuts) {
  auto dir = make_dir("null");
  auto path = dir / "settings.yaml";
  write_file(path,
    "keyboard_shortcuts:\n"
    "  new_shell: null\n"
    "  new_split: ~\n"
    "text_zoom_scale: null\n");
  AppSettings s = load_settings(path.string());
  ASSERT_TRUE(!s.keyboard_shortcuts.new_shell.has_value());
  ASSERT_TRUE(!s.keyboard_shortcuts.new_split.has_value());
  ASSERT_TRUE(!s.text_zoom_scale.has_value());
  ASSERT_TRUE(s.terminal_zoom_scale.has_value());
}

TEST(settings_invalid_values_fall_back) {
  auto dir = make_dir("invalid");
  auto path = dir / "settings.yaml";
  write_file(path,
    "enable_command_logging: perhaps\n"
    "text_zoom_scale: -2\n"
    "terminal_scrollback_lines: -5\n");
  AppSettings s = load_settings(path.string());
  ASSERT_TRUE(s.enable_command_logging);
  ASSERT_NEAR(*s.text_zoom_scale, 1.0, 1e-12);
  ASSERT_EQ(s.terminal_scrollback_lines, 10000);
}

TEST(settings_save_then_load_preserves_values) {
  auto dir = make_dir("save");
  auto path = dir / "nested" / "settings.yaml";
  AppSettings s{};
  s.monitor_visibility.show_network = false;
  s.keyboard_shortcuts.toggle_drawer = "F2";
  s.keyboard_shortcuts.new_shell = "N";
  s.keyboard_shortcuts.new_split = std::nullopt;
  s.enable_command_logging = false;
  s.text_zoom_scale = 1.5;
  s.terminal_zoom_scale = 0.75;
  s.terminal_scrollback_lines = 20000;
  std::string err;
  ASSERT_TRUE(save_settings(path.string(), s, err));
  AppSettings back = load_settings(path.string());
  ASSERT_TRUE(!back.monitor_visibility.show_network);
  ASSERT_EQ(back.keyboard_shortcuts.toggle_drawer, std::string("F2"));
  ASSERT_TRUE(back.keyboard_shortcuts.new_shell == std::optional<std::string>("N"));
  ASSERT_TRUE(!back.keyboard_shortcuts.new_split.has_value());
  ASSERT_TRUE(!back.enable_command_logging);
  ASSERT_NEAR(*back.text_zoom_scale, 1.5, 1e-12);
  ASSERT_NEAR(*back.terminal_zoom_scale, 0.75, 1e-12);
  ASSERT_EQ(back.terminal_scrollback_lines, 20000);
}

TEST(settings_save_to_unwritable_path_fails) {
  auto dir = make_dir("unwritable");
  // a regular file where the parent directory should be
  write_file(dir / "blocker", "x");
  std::string err;
  ASSERT_TRUE(!save_settings((dir / "blocker" / "settings.yaml").string(), AppSettings{}, err));
  ASSERT_TRUE(err.rfind("Failed to write settings config: ", 0) == 0);
}

TEST(settings_zoom_clamps_and_steps) {
  ASSERT_NEAR(clamp_zoom(10.0), zoom::kMaxScale, 1e-12);
  ASSERT_NEAR(clamp_zoom(0.01), zoom::kMinScale, 1e-12);
  ASSERT_NEAR(zoom_in(1.0), 1.1, 1e-12);
  ASSERT_NEAR(zoom_out(1.1), 1.0, 1e-12);
  ASSERT_NEAR(zoom_in(zoom::kMaxScale), zoom::kMaxScale, 1e-12);
  ASSERT_NEAR(zoom_out(zoom::kMinScale), zoom::kMinScale, 1e-12);
}

TEST(settings_key_display_names) {
  ASSERT_EQ(key_to_display("grave"), std::string("`"));
  ASSERT_EQ(key_to_display("t"), std::string("T"));
  ASSERT_EQ(key_to_display("Return"), std::string("Enter"));
  ASSERT_EQ(key_to_display("space"), std::string("Space"));
  ASSERT_EQ(key_to_display("n"), std::string("N"));
}

TEST(settings_captured_key_follows_shift_requirement) {
  ASSERT_EQ(captured_shortcut_key("T", true, true).value_or("?"), std::string("T"));
  ASSERT_EQ(captured_shortcut_key("n", true, true).value_or("?"), std::string("N"));
  ASSERT_EQ(captured_shortcut_key("t", false, false).value_or("?"), std::string("t"));
  ASSERT_EQ(captured_shortcut_key("grave", false, false).value_or("?"), std::string("grave"));
  ASSERT_EQ(captured_shortcut_key("F5", true, true).value_or("?"), std::string("F5"));
  ASSERT_TRUE(!captured_shortcut_key("n", false, true).has_value());
  ASSERT_TRUE(!captured_shortcut_key("T", true, false).has_value());
  ASSERT_TRUE(!captured_shortcut_key("", false, false).has_value());
}

TEST(settings_store_tracks_zoom_and_persists) {
  auto dir = make_dir("store");
  auto path = (dir / "settings.yaml").string();
  auto& store = SettingsStore::instance();
  store.load(path);
  ASSERT_NEAR(store.text_zoom(), 1.0, 1e-12);
  store.set_text_zoom(5.0);
  ASSERT_NEAR(store.text_zoom(), zoom::kMaxScale, 1e-12);
  store.set_terminal_zoom(0.8);
  std::string err;
  ASSERT_TRUE(store.save(err));
  AppSettings back = load_settings(path);
  ASSERT_NEAR(*back.text_zoom_scale, zoom::kMaxScale, 1e-12);
  ASSERT_NEAR(*back.terminal_zoom_scale, 0.8, 1e-12);

  AppSettings s = store.get();
  s.enable_command_logging = false;
  ASSERT_TRUE(store.update(s, err));
  ASSERT_TRUE(!store.command_logging_enabled());
  ASSERT_TRUE(!load_settings(path).enable_command_logging);
}
