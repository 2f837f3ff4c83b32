#include "ui/Dialogs.hpp"

#include <string>

#include "app/CommandStore.hpp"
#include "app/Settings.hpp"
#include "app/Workspace.hpp"
#include "ui/Monitors.hpp"
#include "ui/Zoom.hpp"
#include "util/Log.hpp"

namespace fs = std::filesystem;
using penenv::app::AppSettings;
using penenv::app::SettingsStore;

namespace penenv::ui {

static constexpr int kScrollbackMin = 100;
static constexpr int kScrollbackMax = 100000;
static constexpr int kScrollbackStep = 100;

enum { kResponseUseCurrent = 1, kResponseBrowse = 2 };

static GtkWidget* padded_box(int spacing) {
  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, spacing);
  g_object_set(box, "margin", 20, nullptr);
  return box;
}

static GtkWidget* section_title(const char* text) {
  GtkWidget* label = gtk_label_new(nullptr);
  gchar* markup = g_markup_printf_escaped("<b>%s</b>", text);
  gtk_label_set_markup(GTK_LABEL(label), markup);
  g_free(markup);
  gtk_label_set_xalign(GTK_LABEL(label), 0.0f);
  return label;
}

static GtkWidget* dim_label(const char* text) {
  GtkWidget* label = gtk_label_new(text);
  gtk_label_set_line_wrap(GTK_LABEL(label), TRUE);
  gtk_label_set_xalign(GTK_LABEL(label), 0.0f);
  gtk_style_context_add_class(gtk_widget_get_style_context(label), "dim-label");
  return label;
}

static void message(GtkWindow* parent, const char* title, const std::string& text) {
  GtkWidget* dlg = gtk_message_dialog_new(parent, GTK_DIALOG_MODAL, GTK_MESSAGE_INFO, GTK_BUTTONS_OK, "%s",
                                          text.c_str());
  gtk_window_set_title(GTK_WINDOW(dlg), title);
  gtk_dialog_run(GTK_DIALOG(dlg));
  gtk_widget_destroy(dlg);
}

// Apply fn to a copy of the current settings and persist it.
template <typename Fn>
static bool change_settings(Fn fn) {
  auto& store = SettingsStore::instance();
  AppSettings s = store.get();
  fn(s);
  std::string err;
  if (!store.update(s, err)) {
    PENENV_LOG_ERROR("%s", err.c_str());
    return false;
  }
  return true;
}

// ---- Base directory ----

static std::optional<fs::path> browse_folder(GtkWindow* parent) {
  GtkWidget* chooser = gtk_file_chooser_dialog_new("Select Base Directory", parent,
                                                   GTK_FILE_CHOOSER_ACTION_SELECT_FOLDER, "_Cancel",
                                                   GTK_RESPONSE_CANCEL, "_Select", GTK_RESPONSE_ACCEPT, nullptr);
  std::optional<fs::path> out;
  if (gtk_dialog_run(GTK_DIALOG(chooser)) == GTK_RESPONSE_ACCEPT) {
    gchar* name = gtk_file_chooser_get_filename(GTK_FILE_CHOOSER(chooser));
    if (name) out = fs::path(name);
    g_free(name);
  }
  gtk_widget_destroy(chooser);
  return out;
}

std::optional<fs::path> choose_base_dir(GtkApplication* app) {
  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (ec) cwd = ".";

  GtkWidget* dialog = gtk_dialog_new_with_buttons("Select Base Directory", nullptr, GTK_DIALOG_MODAL, "_Cancel",
                                                  GTK_RESPONSE_CANCEL, "No, browse for directory",
                                                  kResponseBrowse, "Yes, use current directory",
                                                  kResponseUseCurrent, nullptr);
  gtk_window_set_application(GTK_WINDOW(dialog), app);
  gtk_window_set_default_size(GTK_WINDOW(dialog), 500, 200);
  gtk_dialog_set_default_response(GTK_DIALOG(dialog), kResponseUseCurrent);
  GtkWidget* yes = gtk_dialog_get_widget_for_response(GTK_DIALOG(dialog), kResponseUseCurrent);
  gtk_style_context_add_class(gtk_widget_get_style_context(yes), "suggested-action");

  GtkWidget* area = gtk_dialog_get_content_area(GTK_DIALOG(dialog));
  g_object_set(area, "margin", 20, "spacing", 15, nullptr);
  std::string question = "Do you want to use the current directory as the base location?\n\n" + cwd.string();
  GtkWidget* q = gtk_label_new(question.c_str());
  gtk_label_set_line_wrap(GTK_LABEL(q), TRUE);
  gtk_label_set_justify(GTK_LABEL(q), GTK_JUSTIFY_CENTER);
  const char* info = SettingsStore::instance().command_logging_enabled()
                         ? "This directory will store targets.txt, notes.md, and commands.log"
                         : "This directory will store targets.txt and notes.md";
  GtkWidget* i = dim_label(info);
  gtk_label_set_justify(GTK_LABEL(i), GTK_JUSTIFY_CENTER);
  gtk_label_set_xalign(GTK_LABEL(i), 0.5f);
  gtk_box_pack_start(GTK_BOX(area), q, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(area), i, FALSE, FALSE, 0);
  gtk_widget_show_all(dialog);

  std::optional<fs::path> out;
  for (;;) {
    int response = gtk_dialog_run(GTK_DIALOG(dialog));
    if (response == kResponseUseCurrent) {
      out = cwd;
      break;
    }
    if (response == kResponseBrowse) {
      out = browse_folder(GTK_WINDOW(dialog));
      // a cancelled chooser returns to the question
      if (out) break;
      continue;
    }
    break;
  }
  gtk_widget_destroy(dialog);
  return out;
}

// ---- General page ----

static GtkWidget* monitor_check(AppContext& ctx, const char* label, bool active,
                                bool penenv::app::MonitorVisibility::*field) {
  GtkWidget* check = gtk_check_button_new_with_label(label);
  gtk_toggle_button_set_active(GTK_TOGGLE_BUTTON(check), active);
  struct Binding {
    AppContext* ctx;
    bool penenv::app::MonitorVisibility::*field;
  };
  auto* b = new Binding{&ctx, field};
  g_object_set_data_full(G_OBJECT(check), "penenv-binding", b, [](gpointer p) { delete static_cast<Binding*>(p); });
  g_signal_connect(check, "toggled", G_CALLBACK(+[](GtkToggleButton* t, gpointer p) {
    auto* bind = static_cast<Binding*>(p);
    bool on = gtk_toggle_button_get_active(t);
    change_settings([&](AppSettings& s) { s.monitor_visibility.*(bind->field) = on; });
    apply_monitor_visibility(*bind->ctx, SettingsStore::instance().get().monitor_visibility);
  }), b);
  return check;
}

static GtkWidget* zoom_row(AppContext& ctx, const char* label, double value, void (*setter)(AppContext&, double)) {
  GtkWidget* row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 10);
  GtkWidget* l = gtk_label_new(label);
  gtk_label_set_xalign(GTK_LABEL(l), 0.0f);
  gtk_widget_set_size_request(l, 120, -1);
  GtkWidget* scale = gtk_scale_new_with_range(GTK_ORIENTATION_HORIZONTAL, penenv::app::zoom::kMinScale,
                                              penenv::app::zoom::kMaxScale, 0.05);
  gtk_scale_set_digits(GTK_SCALE(scale), 2);
  gtk_range_set_value(GTK_RANGE(scale), value);
  gtk_widget_set_hexpand(scale, TRUE);
  GtkWidget* reset = gtk_button_new_with_label("Reset");

  struct Binding {
    AppContext* ctx;
    void (*setter)(AppContext&, double);
  };
  auto* b = new Binding{&ctx, setter};
  g_object_set_data_full(G_OBJECT(scale), "penenv-binding", b, [](gpointer p) { delete static_cast<Binding*>(p); });
  g_signal_connect(scale, "value-changed", G_CALLBACK(+[](GtkRange* r, gpointer p) {
    auto* bind = static_cast<Binding*>(p);
    bind->setter(*bind->ctx, gtk_range_get_value(r));
  }), b);
  g_signal_connect(reset, "clicked", G_CALLBACK(+[](GtkButton*, gpointer s) {
    gtk_range_set_value(GTK_RANGE(s), penenv::app::zoom::kDefaultScale);
  }), scale);

  gtk_box_pack_start(GTK_BOX(row), l, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(row), scale, TRUE, TRUE, 0);
  gtk_box_pack_start(GTK_BOX(row), reset, FALSE, FALSE, 0);
  return row;
}

static GtkWidget* general_page(AppContext& ctx, GtkWindow* dialog) {
  const AppSettings s = SettingsStore::instance().get();
  GtkWidget* box = padded_box(10);

  gtk_box_pack_start(GTK_BOX(box), section_title("Monitor Settings"), FALSE, FALSE, 0);
  using penenv::app::MonitorVisibility;
  gtk_box_pack_start(GTK_BOX(box), monitor_check(ctx, "Show CPU Monitor", s.monitor_visibility.show_cpu,
                                                 &MonitorVisibility::show_cpu), FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), monitor_check(ctx, "Show RAM Monitor", s.monitor_visibility.show_ram,
                                                 &MonitorVisibility::show_ram), FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), monitor_check(ctx, "Show Network Monitor", s.monitor_visibility.show_network,
                                                 &MonitorVisibility::show_network), FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), gtk_separator_new(GTK_ORIENTATION_HORIZONTAL), FALSE, FALSE, 4);

  gtk_box_pack_start(GTK_BOX(box), section_title("Command Logging"), FALSE, FALSE, 0);
  GtkWidget* logging = gtk_check_button_new_with_label("Enable Command Logging");
  gtk_toggle_button_set_active(GTK_TOGGLE_BUTTON(logging), s.enable_command_logging);
  g_signal_connect(logging, "toggled", G_CALLBACK(+[](GtkToggleButton* t, gpointer p) {
    bool on = gtk_toggle_button_get_active(t);
    if (change_settings([&](AppSettings& st) { st.enable_command_logging = on; }))
      message(GTK_WINDOW(p), "Settings Updated",
              "Please restart PenEnv for the command logging changes to take effect.");
  }), dialog);
  gtk_box_pack_start(GTK_BOX(box), logging, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box),
                     dim_label("When disabled, the Log tab will be hidden and commands will not be logged."),
                     FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), gtk_separator_new(GTK_ORIENTATION_HORIZONTAL), FALSE, FALSE, 4);

  gtk_box_pack_start(GTK_BOX(box), section_title("Terminal"), FALSE, FALSE, 0);
  GtkWidget* sb_row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 10);
  GtkWidget* sb_label = gtk_label_new("Scrollback lines:");
  GtkWidget* spin = gtk_spin_button_new_with_range(kScrollbackMin, kScrollbackMax, kScrollbackStep);
  gtk_spin_button_set_value(GTK_SPIN_BUTTON(spin), static_cast<double>(s.terminal_scrollback_lines));
  g_signal_connect(spin, "value-changed", G_CALLBACK(+[](GtkSpinButton* sp, gpointer p) {
    auto& c = *static_cast<AppContext*>(p);
    int64_t lines = gtk_spin_button_get_value_as_int(sp);
    change_settings([&](AppSettings& st) { st.terminal_scrollback_lines = lines; });
    for (auto* term : c.terminals) vte_terminal_set_scrollback_lines(term, static_cast<glong>(lines));
  }), &ctx);
  gtk_box_pack_start(GTK_BOX(sb_row), sb_label, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(sb_row), spin, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), sb_row, FALSE, FALSE, 0);

  gtk_box_pack_start(GTK_BOX(box), section_title("Zoom"), FALSE, FALSE, 0);
  auto& store = SettingsStore::instance();
  gtk_box_pack_start(GTK_BOX(box), zoom_row(ctx, "Text zoom:", store.text_zoom(), set_text_zoom), FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), zoom_row(ctx, "Terminal zoom:", store.terminal_zoom(), set_terminal_zoom),
                     FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), dim_label("Ctrl+scroll over an editor or terminal also zooms."), FALSE, FALSE, 0);
  return box;
}

// ---- Shortcuts page ----

enum class Shortcut { ToggleDrawer, InsertTarget, InsertTimestamp, NewShell, NewSplit };

struct ShortcutRow {
  Shortcut which;
  const char* title;
  bool shift;
  bool optional;
};

static const ShortcutRow kShortcutRows[] = {
    {Shortcut::ToggleDrawer, "Toggle Command Drawer", false, false},
    {Shortcut::InsertTarget, "Insert Target", false, false},
    {Shortcut::InsertTimestamp, "Insert Timestamp", true, false},
    {Shortcut::NewShell, "New Shell Tab", true, true},
    {Shortcut::NewSplit, "New Split View", true, true},
};

static std::optional<std::string> shortcut_value(const penenv::app::KeyboardShortcuts& k, Shortcut which) {
  switch (which) {
    case Shortcut::ToggleDrawer: return k.toggle_drawer;
    case Shortcut::InsertTarget: return k.insert_target;
    case Shortcut::InsertTimestamp: return k.insert_timestamp;
    case Shortcut::NewShell: return k.new_shell;
    case Shortcut::NewSplit: return k.new_split;
  }
  return std::nullopt;
}

static void set_shortcut(penenv::app::KeyboardShortcuts& k, Shortcut which, std::optional<std::string> v) {
  switch (which) {
    case Shortcut::ToggleDrawer: k.toggle_drawer = v.value_or(""); break;
    case Shortcut::InsertTarget: k.insert_target = v.value_or(""); break;
    case Shortcut::InsertTimestamp: k.insert_timestamp = v.value_or(""); break;
    case Shortcut::NewShell: k.new_shell = std::move(v); break;
    case Shortcut::NewSplit: k.new_split = std::move(v); break;
  }
}

static std::string shortcut_text(const std::optional<std::string>& key, bool shift) {
  if (!key || key->empty()) return "Not assigned";
  return std::string(shift ? "Ctrl+Shift+" : "Ctrl+") + penenv::app::key_to_display(*key);
}

struct CaptureState {
  bool shift{};
  std::string key;
  GtkWidget* shown{};
};

static gboolean on_capture_key(GtkWidget* dialog, GdkEventKey* ev, gpointer data) {
  auto* st = static_cast<CaptureState*>(data);
  if (ev->is_modifier) return TRUE;
  if (ev->keyval == GDK_KEY_Escape) return FALSE;
  if (!(ev->state & GDK_CONTROL_MASK)) return TRUE;
  const gchar* name = gdk_keyval_name(ev->keyval);
  if (!name) return TRUE;
  bool shift = (ev->state & GDK_SHIFT_MASK) != 0;
  auto key = penenv::app::captured_shortcut_key(name, shift, st->shift);
  if (!key) {
    gtk_label_set_text(GTK_LABEL(st->shown), st->shift ? "Hold Shift as well as Ctrl" : "Release Shift, use Ctrl only");
    return TRUE;
  }
  st->key = *key;
  std::string shown = shortcut_text(st->key, st->shift);
  gtk_label_set_text(GTK_LABEL(st->shown), shown.c_str());
  gtk_dialog_response(GTK_DIALOG(dialog), GTK_RESPONSE_OK);
  return TRUE;
}

// Modal key capture. Returns the GDK key name of the pressed Ctrl combination.
static std::optional<std::string> capture_key(GtkWindow* parent, const ShortcutRow& row) {
  std::string title = std::string("Change ") + row.title;
  GtkWidget* dialog = gtk_dialog_new_with_buttons(title.c_str(), parent, GTK_DIALOG_MODAL, "_Cancel",
                                                  GTK_RESPONSE_CANCEL, nullptr);
  gtk_window_set_default_size(GTK_WINDOW(dialog), 400, 150);
  GtkWidget* area = gtk_dialog_get_content_area(GTK_DIALOG(dialog));
  g_object_set(area, "margin", 20, "spacing", 15, nullptr);
  std::string info = std::string("Press Ctrl") + (row.shift ? "+Shift" : "") + " + any key for '" + row.title + "'";
  GtkWidget* info_label = gtk_label_new(info.c_str());
  gtk_label_set_line_wrap(GTK_LABEL(info_label), TRUE);
  CaptureState st;
  st.shift = row.shift;
  st.shown = gtk_label_new("Waiting for key...");
  gtk_box_pack_start(GTK_BOX(area), info_label, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(area), st.shown, FALSE, FALSE, 0);
  g_signal_connect(dialog, "key-press-event", G_CALLBACK(on_capture_key), &st);
  gtk_widget_show_all(dialog);
  int response = gtk_dialog_run(GTK_DIALOG(dialog));
  gtk_widget_destroy(dialog);
  if (response != GTK_RESPONSE_OK || st.key.empty()) return std::nullopt;
  return st.key;
}

struct ShortcutBinding {
  GtkWindow* dialog;
  const ShortcutRow* row;
  GtkWidget* entry;
};

static GtkWidget* shortcuts_page(GtkWindow* dialog) {
  GtkWidget* box = padded_box(12);
  gtk_box_pack_start(GTK_BOX(box), section_title("Keyboard Shortcuts"), FALSE, FALSE, 0);
  const auto keys = SettingsStore::instance().shortcuts();

  for (const auto& row : kShortcutRows) {
    GtkWidget* line = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 10);
    std::string title = std::string(row.title) + ":";
    GtkWidget* label = gtk_label_new(title.c_str());
    gtk_label_set_xalign(GTK_LABEL(label), 0.0f);
    gtk_widget_set_hexpand(label, TRUE);
    GtkWidget* entry = gtk_entry_new();
    gtk_editable_set_editable(GTK_EDITABLE(entry), FALSE);
    gtk_entry_set_width_chars(GTK_ENTRY(entry), 15);
    gtk_entry_set_text(GTK_ENTRY(entry), shortcut_text(shortcut_value(keys, row.which), row.shift).c_str());

    auto* b = new ShortcutBinding{dialog, &row, entry};
    g_object_set_data_full(G_OBJECT(line), "penenv-binding", b,
                           [](gpointer p) { delete static_cast<ShortcutBinding*>(p); });

    GtkWidget* change = gtk_button_new_with_label("Change");
    g_signal_connect(change, "clicked", G_CALLBACK(+[](GtkButton*, gpointer p) {
      auto* bind = static_cast<ShortcutBinding*>(p);
      auto key = capture_key(bind->dialog, *bind->row);
      if (!key) return;
      if (change_settings([&](AppSettings& s) { set_shortcut(s.keyboard_shortcuts, bind->row->which, *key); }))
        gtk_entry_set_text(GTK_ENTRY(bind->entry), shortcut_text(*key, bind->row->shift).c_str());
    }), b);

    gtk_box_pack_start(GTK_BOX(line), label, TRUE, TRUE, 0);
    gtk_box_pack_start(GTK_BOX(line), entry, FALSE, FALSE, 0);
    gtk_box_pack_start(GTK_BOX(line), change, FALSE, FALSE, 0);
    if (row.optional) {
      GtkWidget* clear = gtk_button_new_with_label("Clear");
      g_signal_connect(clear, "clicked", G_CALLBACK(+[](GtkButton*, gpointer p) {
        auto* bind = static_cast<ShortcutBinding*>(p);
        if (change_settings([&](AppSettings& s) { set_shortcut(s.keyboard_shortcuts, bind->row->which, std::nullopt); }))
          gtk_entry_set_text(GTK_ENTRY(bind->entry), "Not assigned");
      }), b);
      gtk_box_pack_start(GTK_BOX(line), clear, FALSE, FALSE, 0);
    }
    gtk_box_pack_start(GTK_BOX(box), line, FALSE, FALSE, 0);
  }
  gtk_box_pack_start(GTK_BOX(box), dim_label("New bindings apply to key presses from now on."), FALSE, FALSE, 0);
  return box;
}

// ---- Custom commands page ----

// Add (index < 0) or edit dialog. Returns true when something was saved.
static bool command_form(GtkWindow* parent, int index, const penenv::model::CommandTemplate* current) {
  const char* title = index < 0 ? "Add Custom Command" : "Edit Custom Command";
  GtkWidget* dialog = gtk_dialog_new_with_buttons(title, parent, GTK_DIALOG_MODAL, "_Cancel", GTK_RESPONSE_CANCEL,
                                                  "_Save", GTK_RESPONSE_OK, nullptr);
  gtk_window_set_default_size(GTK_WINDOW(dialog), 500, -1);
  GtkWidget* area = gtk_dialog_get_content_area(GTK_DIALOG(dialog));
  g_object_set(area, "margin", 20, "spacing", 6, nullptr);

  struct Field {
    const char* label;
    const char* placeholder;
    GtkWidget* entry;
  };
  Field fields[] = {
      {"Command Name:", "e.g., Quick Scan", nullptr},
      {"Command:", "e.g., nmap -sV {target}", nullptr},
      {"Description:", "e.g., Fast service version scan", nullptr},
      {"Category:", "e.g., Custom", nullptr},
  };
  const std::string* initial[] = {nullptr, nullptr, nullptr, nullptr};
  if (current) {
    initial[0] = &current->name;
    initial[1] = &current->command;
    initial[2] = &current->description;
    initial[3] = &current->category;
  }
  for (int i = 0; i < 4; ++i) {
    GtkWidget* l = gtk_label_new(fields[i].label);
    gtk_label_set_xalign(GTK_LABEL(l), 0.0f);
    fields[i].entry = gtk_entry_new();
    gtk_entry_set_placeholder_text(GTK_ENTRY(fields[i].entry), fields[i].placeholder);
    if (initial[i]) gtk_entry_set_text(GTK_ENTRY(fields[i].entry), initial[i]->c_str());
    gtk_box_pack_start(GTK_BOX(area), l, FALSE, FALSE, 0);
    gtk_box_pack_start(GTK_BOX(area), fields[i].entry, FALSE, FALSE, 0);
  }
  GtkWidget* error = gtk_label_new(nullptr);
  gtk_box_pack_start(GTK_BOX(area), dim_label("Tip: Use {target} as a placeholder for target selection"), FALSE,
                     FALSE, 4);
  gtk_box_pack_start(GTK_BOX(area), error, FALSE, FALSE, 0);
  gtk_widget_show_all(dialog);

  bool saved = false;
  while (gtk_dialog_run(GTK_DIALOG(dialog)) == GTK_RESPONSE_OK) {
    std::string err;
    auto cmd = penenv::app::make_custom_command(
        gtk_entry_get_text(GTK_ENTRY(fields[0].entry)), gtk_entry_get_text(GTK_ENTRY(fields[1].entry)),
        gtk_entry_get_text(GTK_ENTRY(fields[2].entry)), gtk_entry_get_text(GTK_ENTRY(fields[3].entry)), err);
    if (cmd) {
      auto path = penenv::app::custom_commands_path();
      bool ok = index < 0 ? penenv::app::save_custom_command(path, *cmd, err)
                          : penenv::app::update_custom_command(path, static_cast<std::size_t>(index), *cmd, err);
      if (ok) {
        saved = true;
        break;
      }
      PENENV_LOG_ERROR("saving custom command: %s", err.c_str());
    }
    gtk_label_set_text(GTK_LABEL(error), err.c_str());
  }
  gtk_widget_destroy(dialog);
  return saved;
}

struct CommandsPage {
  AppContext* ctx{};
  GtkWindow* dialog{};
  GtkWidget* list{};
};

static void populate_commands(CommandsPage* page);

struct RowAction {
  CommandsPage* page;
  int index;
};

static void on_commands_changed(CommandsPage* page) {
  reload_templates(*page->ctx);
  // rebuild after the clicked button's handler has returned
  g_idle_add(+[](gpointer p) -> gboolean {
    populate_commands(static_cast<CommandsPage*>(p));
    return G_SOURCE_REMOVE;
  }, page);
}

static void populate_commands(CommandsPage* page) {
  GList* children = gtk_container_get_children(GTK_CONTAINER(page->list));
  for (GList* it = children; it; it = it->next) gtk_widget_destroy(GTK_WIDGET(it->data));
  g_list_free(children);

  auto commands = penenv::app::load_custom_commands(penenv::app::custom_commands_path());
  if (commands.empty()) {
    GtkWidget* empty = dim_label("No custom commands yet. Click \"Add Command\" to create one.");
    g_object_set(empty, "margin", 20, nullptr);
    gtk_container_add(GTK_CONTAINER(page->list), empty);
  }
  for (std::size_t i = 0; i < commands.size(); ++i) {
    const auto& cmd = commands[i];
    GtkWidget* row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 10);
    g_object_set(row, "margin", 8, nullptr);
    GtkWidget* info = gtk_box_new(GTK_ORIENTATION_VERTICAL, 2);
    GtkWidget* name = section_title(cmd.name.c_str());
    GtkWidget* line = dim_label(cmd.command.c_str());
    gtk_label_set_line_wrap(GTK_LABEL(line), FALSE);
    gtk_label_set_ellipsize(GTK_LABEL(line), PANGO_ELLIPSIZE_END);
    gtk_box_pack_start(GTK_BOX(info), name, FALSE, FALSE, 0);
    gtk_box_pack_start(GTK_BOX(info), line, FALSE, FALSE, 0);

    GtkWidget* edit = gtk_button_new_with_label("Edit");
    GtkWidget* del = gtk_button_new_from_icon_name("user-trash-symbolic", GTK_ICON_SIZE_BUTTON);
    gtk_widget_set_tooltip_text(del, "Delete");
    gtk_style_context_add_class(gtk_widget_get_style_context(del), "destructive-action");

    auto* action = new RowAction{page, static_cast<int>(i)};
    g_object_set_data_full(G_OBJECT(row), "penenv-action", action, [](gpointer p) { delete static_cast<RowAction*>(p); });
    g_signal_connect(edit, "clicked", G_CALLBACK(+[](GtkButton*, gpointer p) {
      auto* a = static_cast<RowAction*>(p);
      auto current = penenv::app::load_custom_commands(penenv::app::custom_commands_path());
      if (a->index >= static_cast<int>(current.size())) return;
      if (command_form(a->page->dialog, a->index, &current[static_cast<std::size_t>(a->index)]))
        on_commands_changed(a->page);
    }), action);
    g_signal_connect(del, "clicked", G_CALLBACK(+[](GtkButton*, gpointer p) {
      auto* a = static_cast<RowAction*>(p);
      std::string err;
      if (!penenv::app::delete_custom_command(penenv::app::custom_commands_path(),
                                              static_cast<std::size_t>(a->index), err)) {
        PENENV_LOG_ERROR("Failed to delete command: %s", err.c_str());
        return;
      }
      on_commands_changed(a->page);
    }), action);

    gtk_box_pack_start(GTK_BOX(row), info, TRUE, TRUE, 0);
    gtk_box_pack_start(GTK_BOX(row), edit, FALSE, FALSE, 0);
    gtk_box_pack_start(GTK_BOX(row), del, FALSE, FALSE, 0);
    gtk_container_add(GTK_CONTAINER(page->list), row);
  }
  gtk_widget_show_all(page->list);
}

static GtkWidget* commands_page(AppContext& ctx, GtkWindow* dialog) {
  GtkWidget* box = padded_box(10);
  gtk_box_pack_start(GTK_BOX(box), section_title("Custom Commands"), FALSE, FALSE, 0);

  auto* page = new CommandsPage{&ctx, dialog, gtk_list_box_new()};
  g_object_set_data_full(G_OBJECT(box), "penenv-commands-page", page,
                         [](gpointer p) { delete static_cast<CommandsPage*>(p); });
  gtk_list_box_set_selection_mode(GTK_LIST_BOX(page->list), GTK_SELECTION_NONE);
  GtkWidget* sw = gtk_scrolled_window_new(nullptr, nullptr);
  gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(sw), 250);
  gtk_widget_set_vexpand(sw, TRUE);
  gtk_container_add(GTK_CONTAINER(sw), page->list);
  gtk_box_pack_start(GTK_BOX(box), sw, TRUE, TRUE, 0);

  GtkWidget* add = gtk_button_new_with_label("Add Command");
  gtk_style_context_add_class(gtk_widget_get_style_context(add), "suggested-action");
  gtk_widget_set_halign(add, GTK_ALIGN_START);
  g_signal_connect(add, "clicked", G_CALLBACK(+[](GtkButton*, gpointer p) {
    auto* pg = static_cast<CommandsPage*>(p);
    if (command_form(pg->dialog, -1, nullptr)) on_commands_changed(pg);
  }), page);
  gtk_box_pack_start(GTK_BOX(box), add, FALSE, FALSE, 0);
  populate_commands(page);
  return box;
}

void show_settings_dialog(AppContext& ctx) {
  GtkWidget* dialog = gtk_dialog_new_with_buttons("Settings", ctx.window, GTK_DIALOG_MODAL, "_Close",
                                                  GTK_RESPONSE_CLOSE, nullptr);
  gtk_window_set_default_size(GTK_WINDOW(dialog), 600, 520);
  GtkWidget* notebook = gtk_notebook_new();
  gtk_notebook_append_page(GTK_NOTEBOOK(notebook), general_page(ctx, GTK_WINDOW(dialog)), gtk_label_new("General"));
  gtk_notebook_append_page(GTK_NOTEBOOK(notebook), shortcuts_page(GTK_WINDOW(dialog)), gtk_label_new("Shortcuts"));
  gtk_notebook_append_page(GTK_NOTEBOOK(notebook), commands_page(ctx, GTK_WINDOW(dialog)),
                           gtk_label_new("Custom Commands"));
  GtkWidget* area = gtk_dialog_get_content_area(GTK_DIALOG(dialog));
  gtk_box_pack_start(GTK_BOX(area), notebook, TRUE, TRUE, 0);
  gtk_widget_show_all(dialog);
  gtk_dialog_run(GTK_DIALOG(dialog));
  gtk_widget_destroy(dialog);
}

} // namespace penenv::ui
