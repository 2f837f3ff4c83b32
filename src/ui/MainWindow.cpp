#include "ui/MainWindow.hpp"

#include <optional>
#include <string>

#include "app/Settings.hpp"
#include "ui/Dialogs.hpp"
#include "ui/Editor.hpp"
#include "ui/Monitors.hpp"
#include "ui/ShellTab.hpp"
#include "ui/Zoom.hpp"
#include "util/Log.hpp"

namespace penenv::ui {

static constexpr int kWindowWidth = 1200;
static constexpr int kWindowHeight = 800;

static gboolean on_window_key(GtkWidget*, GdkEventKey* ev, gpointer data) {
  auto& ctx = *static_cast<AppContext*>(data);
  auto keys = penenv::app::SettingsStore::instance().shortcuts();
  if (keys.new_shell && shortcut_matches(ev, *keys.new_shell, true)) {
    open_shell_tab(ctx, true);
    return TRUE;
  }
  if (keys.new_split && shortcut_matches(ev, *keys.new_split, true)) {
    open_split_tab(ctx);
    return TRUE;
  }
  bool ctrl = (ev->state & GDK_CONTROL_MASK) != 0;
  bool shift = (ev->state & GDK_SHIFT_MASK) != 0;
  if (ctrl && !shift && ev->keyval >= GDK_KEY_1 && ev->keyval <= GDK_KEY_9) {
    int page = static_cast<int>(ev->keyval - GDK_KEY_1);
    if (page < gtk_notebook_get_n_pages(ctx.notebook)) {
      gtk_notebook_set_current_page(ctx.notebook, page);
      focus_terminal_in(gtk_notebook_get_nth_page(ctx.notebook, page));
    }
    return TRUE;
  }
  return FALSE;
}

static GtkWidget* header_button(const char* label, const char* tooltip) {
  GtkWidget* b = gtk_button_new_with_label(label);
  if (tooltip) gtk_widget_set_tooltip_text(b, tooltip);
  return b;
}

static std::string shift_hint(const std::optional<std::string>& key) {
  if (!key || key->empty()) return {};
  return " (Ctrl+Shift+" + penenv::app::key_to_display(*key) + ")";
}

static GtkWidget* build_header(AppContext& ctx, bool logging) {
  GtkWidget* header = gtk_header_bar_new();
  gtk_header_bar_set_show_close_button(GTK_HEADER_BAR(header), TRUE);
  gtk_header_bar_set_title(GTK_HEADER_BAR(header), "PenEnv");
  std::string subtitle = ctx.workspace.base_dir().string();
  gtk_header_bar_set_subtitle(GTK_HEADER_BAR(header), subtitle.c_str());

  auto keys = penenv::app::SettingsStore::instance().shortcuts();
  std::string shell_tip = "Open a new shell tab" + shift_hint(keys.new_shell);
  std::string split_tip = "Notes and a shell side by side" + shift_hint(keys.new_split);

  GtkWidget* new_shell = header_button("New Shell", shell_tip.c_str());
  g_signal_connect(new_shell, "clicked", G_CALLBACK(+[](GtkButton*, gpointer p) {
    open_shell_tab(*static_cast<AppContext*>(p), true);
  }), &ctx);
  gtk_header_bar_pack_start(GTK_HEADER_BAR(header), new_shell);

  if (logging) {
    GtkWidget* no_log = header_button("New Shell (No Logging)", "Shell whose commands are not written to the log");
    g_signal_connect(no_log, "clicked", G_CALLBACK(+[](GtkButton*, gpointer p) {
      open_shell_tab(*static_cast<AppContext*>(p), false);
    }), &ctx);
    gtk_header_bar_pack_start(GTK_HEADER_BAR(header), no_log);
  }

  GtkWidget* split = header_button("Split View", split_tip.c_str());
  g_signal_connect(split, "clicked", G_CALLBACK(+[](GtkButton*, gpointer p) {
    open_split_tab(*static_cast<AppContext*>(p));
  }), &ctx);
  gtk_header_bar_pack_start(GTK_HEADER_BAR(header), split);

  GtkWidget* settings = gtk_button_new_from_icon_name("preferences-system-symbolic", GTK_ICON_SIZE_BUTTON);
  gtk_widget_set_tooltip_text(settings, "Settings");
  g_signal_connect(settings, "clicked", G_CALLBACK(+[](GtkButton*, gpointer p) {
    show_settings_dialog(*static_cast<AppContext*>(p));
  }), &ctx);
  gtk_header_bar_pack_end(GTK_HEADER_BAR(header), settings);
  gtk_header_bar_pack_end(GTK_HEADER_BAR(header), create_monitors(ctx));
  return header;
}

static void add_fixed_tab(AppContext& ctx, GtkWidget* page, const char* title) {
  gtk_notebook_append_page(ctx.notebook, page, gtk_label_new(title));
}

void build_main_window(AppContext& ctx) {
  const auto settings = penenv::app::SettingsStore::instance().get();
  const bool logging = settings.enable_command_logging;

  GtkWidget* window = gtk_application_window_new(ctx.app);
  ctx.window = GTK_WINDOW(window);
  gtk_window_set_title(ctx.window, "PenEnv - Pentesting Environment");
  gtk_window_set_default_size(ctx.window, kWindowWidth, kWindowHeight);
  gtk_window_set_icon_name(ctx.window, "penenv");
  gtk_window_set_titlebar(ctx.window, build_header(ctx, logging));

  GtkWidget* notebook = gtk_notebook_new();
  ctx.notebook = GTK_NOTEBOOK(notebook);
  gtk_notebook_set_scrollable(ctx.notebook, TRUE);
  add_fixed_tab(ctx, create_targets_editor(ctx), "Targets");
  add_fixed_tab(ctx, create_notes_editor(ctx), "Notes");
  if (logging) add_fixed_tab(ctx, create_log_viewer(ctx), "Command Log");
  gtk_container_add(GTK_CONTAINER(window), notebook);

  g_signal_connect(window, "key-press-event", G_CALLBACK(on_window_key), &ctx);
  g_signal_connect(window, "destroy", G_CALLBACK(+[](GtkWidget*, gpointer p) {
    auto& c = *static_cast<AppContext*>(p);
    flush_notes(c);
    stop_monitors(c);
    c.window = nullptr;
    c.notebook = nullptr;
  }), &ctx);

  apply_text_zoom(ctx);
  gtk_widget_show_all(window);
  apply_monitor_visibility(ctx, settings.monitor_visibility);

  open_shell_tab(ctx, true);
  apply_terminal_zoom(ctx);
  start_log_refresh(ctx);
  start_monitors(ctx);
  PENENV_LOG_INFO("main window ready, base directory %s", ctx.workspace.base_dir().c_str());
}

} // namespace penenv::ui
