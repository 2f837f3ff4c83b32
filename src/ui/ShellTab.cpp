#include "ui/ShellTab.hpp"

#include <cstdlib>
#include <string>

#include "app/CommandLog.hpp"
#include "app/Settings.hpp"
#include "ui/CommandDrawer.hpp"
#include "ui/Editor.hpp"
#include "ui/TargetPicker.hpp"
#include "ui/Zoom.hpp"
#include "util/Log.hpp"

namespace penenv::ui {

static constexpr int kSplitPosition = 600;
static const char* const kShellPath = "/bin/bash";

struct ShellView {
  AppContext* ctx{};
  VteTerminal* term{};
  GtkWidget* drawer{};
  GtkWidget* drawer_button{};
};

static ShellView* shell_of(GtkWidget* w) {
  return static_cast<ShellView*>(g_object_get_data(G_OBJECT(w), "penenv-shell"));
}

static void terminal_notice(VteTerminal* term, const std::string& msg) {
  std::string m = "\r\n[penenv] " + msg + "\r\n";
  vte_terminal_feed(term, m.c_str(), static_cast<gssize>(m.size()));
}

static void on_spawn_ready(VteTerminal* term, GPid pid, GError* error, gpointer) {
  if (error) {
    PENENV_LOG_ERROR("shell spawn failed: %s", error->message);
    terminal_notice(term, std::string("spawn failed: ") + error->message);
    return;
  }
  PENENV_LOG_DEBUG("shell spawned, pid=%d", static_cast<int>(pid));
}

static void on_child_exited(VteTerminal* term, gint status, gpointer) {
  terminal_notice(term, "shell exited with status " + std::to_string(status));
}

static void spawn_shell(AppContext& ctx, VteTerminal* term, bool logging) {
  const auto settings = penenv::app::SettingsStore::instance().get();
  CStrv env(penenv::app::shell_environment(
      [](const char* k) -> const char* { return std::getenv(k); }, settings.enable_command_logging, logging,
      ctx.workspace.log_path().string()));
  std::string cwd = ctx.workspace.base_dir().string();
  char* argv[] = {const_cast<char*>(kShellPath), nullptr};
  vte_terminal_spawn_async(term, VTE_PTY_DEFAULT, cwd.c_str(), argv, env.data(), G_SPAWN_DEFAULT,
                           nullptr, nullptr, nullptr, -1, nullptr, on_spawn_ready, nullptr);
}

static void copy_selection(VteTerminal* term) {
  if (vte_terminal_get_has_selection(term)) vte_terminal_copy_clipboard_format(term, VTE_FORMAT_TEXT);
}

static void feed_target(VteTerminal* term, const std::string& target) {
  vte_terminal_feed_child(term, target.c_str(), static_cast<gssize>(target.size()));
  gtk_widget_grab_focus(GTK_WIDGET(term));
}

static void set_drawer(ShellView* sv, bool open) {
  // the toggle button's handler opens or closes the drawer
  gtk_toggle_button_set_active(GTK_TOGGLE_BUTTON(sv->drawer_button), open ? TRUE : FALSE);
}

static gboolean on_terminal_key(GtkWidget*, GdkEventKey* ev, gpointer data) {
  auto* sv = static_cast<ShellView*>(data);
  bool ctrl = (ev->state & GDK_CONTROL_MASK) != 0;
  bool shift = (ev->state & GDK_SHIFT_MASK) != 0;
  if (ctrl && shift) {
    guint k = gdk_keyval_to_lower(ev->keyval);
    if (k == GDK_KEY_c) {
      copy_selection(sv->term);
      return TRUE;
    }
    if (k == GDK_KEY_v) {
      vte_terminal_paste_clipboard(sv->term);
      return TRUE;
    }
  }
  auto keys = penenv::app::SettingsStore::instance().shortcuts();
  if (shortcut_matches(ev, keys.toggle_drawer, false)) {
    set_drawer(sv, !drawer_open(sv->drawer));
    return TRUE;
  }
  if (shortcut_matches(ev, keys.insert_target, false)) {
    VteTerminal* term = sv->term;
    show_target_popup(*sv->ctx, GTK_WIDGET(term), [term](const std::string& t) { feed_target(term, t); });
    return TRUE;
  }
  return FALSE;
}

static gboolean on_terminal_button(GtkWidget*, GdkEventButton* event, gpointer data) {
  if (event->type != GDK_BUTTON_PRESS || event->button != 3) return FALSE;
  VteTerminal* term = VTE_TERMINAL(data);
  GtkWidget* menu = gtk_menu_new();
  GtkWidget* copy = gtk_menu_item_new_with_label("Copy");
  GtkWidget* paste = gtk_menu_item_new_with_label("Paste");
  gtk_widget_set_sensitive(copy, vte_terminal_get_has_selection(term));
  g_signal_connect(copy, "activate", G_CALLBACK(+[](GtkMenuItem*, gpointer t) {
    copy_selection(VTE_TERMINAL(t));
  }), term);
  g_signal_connect(paste, "activate", G_CALLBACK(+[](GtkMenuItem*, gpointer t) {
    vte_terminal_paste_clipboard(VTE_TERMINAL(t));
  }), term);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu), copy);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu), paste);
  gtk_menu_attach_to_widget(GTK_MENU(menu), GTK_WIDGET(term), nullptr);
  g_signal_connect(menu, "deactivate", G_CALLBACK(+[](GtkMenuShell* m, gpointer) {
    // destroy after the activate signal of the chosen item has run
    g_idle_add(+[](gpointer w) -> gboolean {
      gtk_widget_destroy(GTK_WIDGET(w));
      return G_SOURCE_REMOVE;
    }, m);
  }), nullptr);
  gtk_widget_show_all(menu);
  gtk_menu_popup_at_pointer(GTK_MENU(menu), reinterpret_cast<GdkEvent*>(event));
  return TRUE;
}

GtkWidget* create_shell_view(AppContext& ctx, bool logging) {
  auto* sv = new ShellView{};
  sv->ctx = &ctx;

  GtkWidget* outer = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
  g_object_set_data_full(G_OBJECT(outer), "penenv-shell", sv, [](gpointer p) { delete static_cast<ShellView*>(p); });

  GtkWidget* term_widget = vte_terminal_new();
  sv->term = VTE_TERMINAL(term_widget);
  gtk_widget_set_hexpand(term_widget, TRUE);
  gtk_widget_set_vexpand(term_widget, TRUE);
  const auto settings = penenv::app::SettingsStore::instance().get();
  vte_terminal_set_scrollback_lines(sv->term, static_cast<glong>(settings.terminal_scrollback_lines));
  vte_terminal_set_scroll_on_keystroke(sv->term, TRUE);
  vte_terminal_set_audible_bell(sv->term, FALSE);
  vte_terminal_set_font_scale(sv->term, penenv::app::SettingsStore::instance().terminal_zoom());
  track_terminal(ctx, sv->term);
  connect_terminal_scroll_zoom(ctx, sv->term);
  g_signal_connect(term_widget, "key-press-event", G_CALLBACK(on_terminal_key), sv);
  g_signal_connect(term_widget, "button-press-event", G_CALLBACK(on_terminal_button), term_widget);
  g_signal_connect(term_widget, "child-exited", G_CALLBACK(on_child_exited), nullptr);

  // top bar: targets on the left, drawer toggle on the right
  GtkWidget* top = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
  g_object_set(top, "margin-start", 4, "margin-end", 4, "margin-top", 4, nullptr);
  VteTerminal* term = sv->term;
  GtkWidget* bar = create_target_bar(ctx, [term](const std::string& t) { feed_target(term, t); });
  sv->drawer_button = gtk_toggle_button_new_with_label("Commands");
  std::string tip = "Command drawer (Ctrl+" +
                    penenv::app::key_to_display(penenv::app::SettingsStore::instance().shortcuts().toggle_drawer) + ")";
  gtk_widget_set_tooltip_text(sv->drawer_button, tip.c_str());
  if (!logging) {
    GtkWidget* badge = gtk_label_new("logging off");
    gtk_style_context_add_class(gtk_widget_get_style_context(badge), "dim-label");
    gtk_box_pack_end(GTK_BOX(top), badge, FALSE, FALSE, 0);
  }
  gtk_box_pack_start(GTK_BOX(top), bar, TRUE, TRUE, 0);
  gtk_box_pack_end(GTK_BOX(top), sv->drawer_button, FALSE, FALSE, 0);

  GtkWidget* body = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 0);
  GtkWidget* scrollbar = gtk_scrollbar_new(GTK_ORIENTATION_VERTICAL,
                                           gtk_scrollable_get_vadjustment(GTK_SCROLLABLE(term_widget)));
  sv->drawer = create_command_drawer(ctx, sv->term);
  gtk_box_pack_start(GTK_BOX(body), term_widget, TRUE, TRUE, 0);
  gtk_box_pack_start(GTK_BOX(body), scrollbar, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(body), sv->drawer, FALSE, FALSE, 0);

  g_signal_connect(sv->drawer_button, "toggled", G_CALLBACK(+[](GtkToggleButton* b, gpointer p) {
    auto* s = static_cast<ShellView*>(p);
    bool want = gtk_toggle_button_get_active(b);
    if (want != drawer_open(s->drawer)) set_drawer_open(s->drawer, want);
    if (!want) gtk_widget_grab_focus(GTK_WIDGET(s->term));
  }), sv);
  // keep the button in step when the drawer closes itself
  g_signal_connect(sv->drawer, "notify::reveal-child", G_CALLBACK(+[](GObject*, GParamSpec*, gpointer p) {
    auto* s = static_cast<ShellView*>(p);
    gboolean open = drawer_open(s->drawer) ? TRUE : FALSE;
    if (gtk_toggle_button_get_active(GTK_TOGGLE_BUTTON(s->drawer_button)) != open)
      gtk_toggle_button_set_active(GTK_TOGGLE_BUTTON(s->drawer_button), open);
  }), sv);

  gtk_box_pack_start(GTK_BOX(outer), top, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(outer), body, TRUE, TRUE, 0);

  spawn_shell(ctx, sv->term, logging);
  return outer;
}

void focus_terminal_in(GtkWidget* page) {
  auto* target = static_cast<GtkWidget*>(g_object_get_data(G_OBJECT(page), "penenv-page-shell"));
  ShellView* sv = shell_of(target ? target : page);
  if (sv) gtk_widget_grab_focus(GTK_WIDGET(sv->term));
}

static void rename_dialog(AppContext& ctx, GtkLabel* label) {
  GtkWidget* dialog = gtk_dialog_new_with_buttons("Rename Tab", ctx.window, GTK_DIALOG_MODAL,
                                                  "_Cancel", GTK_RESPONSE_CANCEL, "_OK", GTK_RESPONSE_OK, nullptr);
  gtk_dialog_set_default_response(GTK_DIALOG(dialog), GTK_RESPONSE_OK);
  GtkWidget* entry = gtk_entry_new();
  gtk_entry_set_text(GTK_ENTRY(entry), gtk_label_get_text(label));
  gtk_entry_set_activates_default(GTK_ENTRY(entry), TRUE);
  GtkWidget* area = gtk_dialog_get_content_area(GTK_DIALOG(dialog));
  g_object_set(area, "margin", 10, nullptr);
  gtk_box_pack_start(GTK_BOX(area), entry, FALSE, FALSE, 0);
  gtk_widget_show_all(dialog);
  if (gtk_dialog_run(GTK_DIALOG(dialog)) == GTK_RESPONSE_OK) {
    const char* text = gtk_entry_get_text(GTK_ENTRY(entry));
    if (text && *text) gtk_label_set_text(label, text);
  }
  gtk_widget_destroy(dialog);
}

GtkWidget* create_tab_label(AppContext& ctx, GtkWidget* page, const std::string& text, bool closable) {
  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 4);
  GtkWidget* events = gtk_event_box_new();
  gtk_event_box_set_visible_window(GTK_EVENT_BOX(events), FALSE);
  GtkWidget* label = gtk_label_new(text.c_str());
  gtk_container_add(GTK_CONTAINER(events), label);
  g_object_set_data(G_OBJECT(events), "penenv-label", label);
  g_signal_connect(events, "button-press-event", G_CALLBACK(+[](GtkWidget* w, GdkEventButton* ev, gpointer p) -> gboolean {
    if (ev->type != GDK_2BUTTON_PRESS || ev->button != 1) return FALSE;
    rename_dialog(*static_cast<AppContext*>(p), GTK_LABEL(g_object_get_data(G_OBJECT(w), "penenv-label")));
    return TRUE;
  }), &ctx);
  gtk_box_pack_start(GTK_BOX(box), events, TRUE, TRUE, 0);

  if (closable) {
    GtkWidget* close = gtk_button_new_from_icon_name("window-close-symbolic", GTK_ICON_SIZE_MENU);
    gtk_button_set_relief(GTK_BUTTON(close), GTK_RELIEF_NONE);
    gtk_widget_set_focus_on_click(close, FALSE);
    gtk_widget_set_tooltip_text(close, "Close tab");
    g_object_set_data(G_OBJECT(close), "penenv-page", page);
    g_signal_connect(close, "clicked", G_CALLBACK(+[](GtkButton* b, gpointer p) {
      auto& c = *static_cast<AppContext*>(p);
      auto* pg = static_cast<GtkWidget*>(g_object_get_data(G_OBJECT(b), "penenv-page"));
      int num = gtk_notebook_page_num(c.notebook, pg);
      if (num >= 0) gtk_notebook_remove_page(c.notebook, num);
    }), &ctx);
    gtk_box_pack_start(GTK_BOX(box), close, FALSE, FALSE, 0);
  }
  gtk_widget_show_all(box);
  return box;
}

static void append_page(AppContext& ctx, GtkWidget* page, const std::string& title) {
  gtk_widget_show_all(page);
  int num = gtk_notebook_append_page(ctx.notebook, page, create_tab_label(ctx, page, title, true));
  gtk_notebook_set_tab_reorderable(ctx.notebook, page, TRUE);
  gtk_notebook_set_current_page(ctx.notebook, num);
  focus_terminal_in(page);
}

void open_shell_tab(AppContext& ctx, bool logging) {
  ++ctx.shell_counter;
  GtkWidget* page = create_shell_view(ctx, logging);
  std::string title = "Shell " + std::to_string(ctx.shell_counter);
  if (!logging) title += " (No Log)";
  append_page(ctx, page, title);
}

void open_split_tab(AppContext& ctx) {
  GtkWidget* paned = gtk_paned_new(GTK_ORIENTATION_HORIZONTAL);
  g_object_set(paned, "margin", 5, nullptr);
  GtkWidget* notes = create_notes_editor(ctx);
  GtkWidget* shell = create_shell_view(ctx, true);
  gtk_paned_pack1(GTK_PANED(paned), notes, TRUE, FALSE);
  gtk_paned_pack2(GTK_PANED(paned), shell, TRUE, FALSE);
  gtk_paned_set_position(GTK_PANED(paned), kSplitPosition);
  g_object_set_data(G_OBJECT(paned), "penenv-page-shell", shell);
  append_page(ctx, paned, "Split View");
}

} // namespace penenv::ui
