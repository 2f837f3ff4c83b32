#include "ui/Editor.hpp"

#include <chrono>
#include <string>

#include "app/CommandLog.hpp"
#include "app/Markdown.hpp"
#include "app/Settings.hpp"
#include "ui/TargetPicker.hpp"
#include "ui/Zoom.hpp"
#include "util/Log.hpp"

namespace penenv::ui {

static constexpr guint kNotesSaveDelayMs = 500;
static constexpr guint kLogRefreshMs = 2000;

static std::string buffer_text(GtkTextBuffer* buf) {
  GtkTextIter start, end;
  gtk_text_buffer_get_bounds(buf, &start, &end);
  gchar* raw = gtk_text_buffer_get_text(buf, &start, &end, FALSE);
  std::string out = raw ? raw : "";
  g_free(raw);
  return out;
}

// Files may hold bytes that are not UTF-8; GtkTextBuffer rejects those.
static void set_buffer_text(GtkTextBuffer* buf, const std::string& text) {
  gchar* valid = g_utf8_make_valid(text.c_str(), static_cast<gssize>(text.size()));
  gtk_text_buffer_set_text(buf, valid, -1);
  g_free(valid);
}

static GtkWidget* scrolled(GtkWidget* child) {
  GtkWidget* sw = gtk_scrolled_window_new(nullptr, nullptr);
  gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(sw), GTK_POLICY_AUTOMATIC, GTK_POLICY_AUTOMATIC);
  gtk_widget_set_vexpand(sw, TRUE);
  gtk_widget_set_hexpand(sw, TRUE);
  gtk_container_add(GTK_CONTAINER(sw), child);
  return sw;
}

static GtkWidget* make_text_view(AppContext& ctx, GtkTextBuffer* buf) {
  GtkWidget* view = gtk_text_view_new_with_buffer(buf);
  gtk_text_view_set_left_margin(GTK_TEXT_VIEW(view), 8);
  gtk_text_view_set_right_margin(GTK_TEXT_VIEW(view), 8);
  gtk_text_view_set_top_margin(GTK_TEXT_VIEW(view), 6);
  track_text_view(ctx, view);
  connect_text_scroll_zoom(ctx, view);
  return view;
}

void insert_into_view(GtkTextView* view, const std::string& text) {
  GtkTextBuffer* buf = gtk_text_view_get_buffer(view);
  gtk_text_buffer_insert_at_cursor(buf, text.c_str(), static_cast<gint>(text.size()));
  gtk_widget_grab_focus(GTK_WIDGET(view));
}

// ---- Targets ----

static gboolean on_targets_key(GtkWidget*, GdkEventKey* ev, gpointer data) {
  auto& ctx = *static_cast<AppContext*>(data);
  bool ctrl = (ev->state & GDK_CONTROL_MASK) != 0;
  if (!ctrl || gdk_keyval_to_lower(ev->keyval) != GDK_KEY_s) return FALSE;
  std::string err;
  if (!penenv::app::write_text(ctx.workspace.targets_path(), buffer_text(ctx.targets_buffer), err)) {
    PENENV_LOG_ERROR("saving targets: %s", err.c_str());
    return TRUE;
  }
  refresh_target_combos(ctx);
  return TRUE;
}

GtkWidget* create_targets_editor(AppContext& ctx) {
  if (!ctx.targets_buffer) {
    ctx.targets_buffer = gtk_text_buffer_new(nullptr);
    auto text = penenv::app::read_text(ctx.workspace.targets_path());
    if (text) set_buffer_text(ctx.targets_buffer, *text);
  }
  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
  GtkWidget* hint = gtk_label_new("One target per line. Lines starting with # are ignored. Ctrl+S to save.");
  gtk_label_set_xalign(GTK_LABEL(hint), 0.0f);
  g_object_set(hint, "margin", 6, nullptr);
  gtk_style_context_add_class(gtk_widget_get_style_context(hint), "dim-label");

  GtkWidget* view = make_text_view(ctx, ctx.targets_buffer);
  g_signal_connect(view, "key-press-event", G_CALLBACK(on_targets_key), &ctx);

  gtk_box_pack_start(GTK_BOX(box), hint, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), scrolled(view), TRUE, TRUE, 0);
  return box;
}

// ---- Notes ----

static void create_markdown_tags(GtkTextBuffer* buf) {
  static const double kHeadingScale[] = {1.6, 1.4, 1.25, 1.15, 1.05, 1.0};
  for (int i = 0; i < 6; ++i) {
    std::string name = "h" + std::to_string(i + 1);
    gtk_text_buffer_create_tag(buf, name.c_str(), "weight", PANGO_WEIGHT_BOLD, "scale", kHeadingScale[i],
                               "foreground", "#4fa3e0", nullptr);
  }
  gtk_text_buffer_create_tag(buf, "bold", "weight", PANGO_WEIGHT_BOLD, nullptr);
  gtk_text_buffer_create_tag(buf, "italic", "style", PANGO_STYLE_ITALIC, nullptr);
  gtk_text_buffer_create_tag(buf, "code", "family", "monospace", "background", "#3a3a3a",
                             "foreground", "#e6db74", nullptr);
  gtk_text_buffer_create_tag(buf, "code_block", "family", "monospace", "paragraph-background", "#2b2b2b",
                             "foreground", "#a6e22e", nullptr);
  gtk_text_buffer_create_tag(buf, "link", "underline", PANGO_UNDERLINE_SINGLE, "foreground", "#66d9ef", nullptr);
  gtk_text_buffer_create_tag(buf, "list", "foreground", "#f92672", "weight", PANGO_WEIGHT_BOLD, nullptr);
  gtk_text_buffer_create_tag(buf, "blockquote", "style", PANGO_STYLE_ITALIC, "foreground", "#999999", nullptr);
}

static void rehighlight(GtkTextBuffer* buf) {
  GtkTextIter start, end;
  gtk_text_buffer_get_bounds(buf, &start, &end);
  gtk_text_buffer_remove_all_tags(buf, &start, &end);
  for (const auto& span : penenv::app::highlight_markdown(buffer_text(buf))) {
    GtkTextIter a, b;
    gtk_text_buffer_get_iter_at_offset(buf, &a, span.start);
    gtk_text_buffer_get_iter_at_offset(buf, &b, span.end);
    gtk_text_buffer_apply_tag_by_name(buf, span.tag.c_str(), &a, &b);
  }
}

static void save_notes(AppContext& ctx) {
  std::string err;
  if (!penenv::app::write_text(ctx.workspace.notes_path(), buffer_text(ctx.notes_buffer), err))
    PENENV_LOG_ERROR("saving notes: %s", err.c_str());
}

static gboolean on_notes_save_timeout(gpointer data) {
  auto& ctx = *static_cast<AppContext*>(data);
  ctx.notes_save_source = 0;
  save_notes(ctx);
  return G_SOURCE_REMOVE;
}

static void on_notes_changed(GtkTextBuffer* buf, gpointer data) {
  auto& ctx = *static_cast<AppContext*>(data);
  rehighlight(buf);
  if (ctx.notes_save_source) g_source_remove(ctx.notes_save_source);
  ctx.notes_save_source = g_timeout_add(kNotesSaveDelayMs, on_notes_save_timeout, &ctx);
}

void flush_notes(AppContext& ctx) {
  if (!ctx.notes_save_source) return;
  g_source_remove(ctx.notes_save_source);
  ctx.notes_save_source = 0;
  save_notes(ctx);
}

static void ensure_notes_buffer(AppContext& ctx) {
  if (ctx.notes_buffer) return;
  ctx.notes_buffer = gtk_text_buffer_new(nullptr);
  create_markdown_tags(ctx.notes_buffer);
  auto text = penenv::app::read_text(ctx.workspace.notes_path());
  if (text) set_buffer_text(ctx.notes_buffer, *text);
  rehighlight(ctx.notes_buffer);
  g_signal_connect(ctx.notes_buffer, "changed", G_CALLBACK(on_notes_changed), &ctx);
}

static gboolean on_notes_key(GtkWidget* view, GdkEventKey* ev, gpointer data) {
  auto& ctx = *static_cast<AppContext*>(data);
  auto keys = penenv::app::SettingsStore::instance().shortcuts();
  if (shortcut_matches(ev, keys.insert_target, false)) {
    GtkTextView* tv = GTK_TEXT_VIEW(view);
    show_target_popup(ctx, view, [tv](const std::string& target) { insert_into_view(tv, target); });
    return TRUE;
  }
  if (shortcut_matches(ev, keys.insert_timestamp, true)) {
    insert_into_view(GTK_TEXT_VIEW(view), penenv::app::timestamp_prefix(std::chrono::system_clock::now()));
    return TRUE;
  }
  return FALSE;
}

GtkWidget* create_notes_editor(AppContext& ctx) {
  ensure_notes_buffer(ctx);
  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
  GtkWidget* view = make_text_view(ctx, ctx.notes_buffer);
  gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(view), GTK_WRAP_WORD_CHAR);
  g_signal_connect(view, "key-press-event", G_CALLBACK(on_notes_key), &ctx);

  GtkTextView* tv = GTK_TEXT_VIEW(view);
  GtkWidget* bar = create_target_bar(ctx, [tv](const std::string& target) { insert_into_view(tv, target); });
  g_object_set(bar, "margin", 4, nullptr);

  gtk_box_pack_start(GTK_BOX(box), bar, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), scrolled(view), TRUE, TRUE, 0);
  return box;
}

// ---- Command log ----

static GtkWidget* g_log_view = nullptr;

void refresh_log_view(AppContext& ctx) {
  if (!ctx.log_buffer) return;
  auto text = penenv::app::read_text(ctx.workspace.log_path());
  std::string now = text ? *text : std::string{};
  if (now == ctx.last_log_text) return;
  ctx.last_log_text = now;
  set_buffer_text(ctx.log_buffer, now);
  if (g_log_view) {
    GtkTextIter end;
    gtk_text_buffer_get_end_iter(ctx.log_buffer, &end);
    GtkTextMark* mark = gtk_text_buffer_create_mark(ctx.log_buffer, nullptr, &end, FALSE);
    gtk_text_view_scroll_to_mark(GTK_TEXT_VIEW(g_log_view), mark, 0.0, TRUE, 0.0, 1.0);
    gtk_text_buffer_delete_mark(ctx.log_buffer, mark);
  }
}

GtkWidget* create_log_viewer(AppContext& ctx) {
  if (!ctx.log_buffer) ctx.log_buffer = gtk_text_buffer_new(nullptr);
  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
  GtkWidget* top = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
  g_object_set(top, "margin", 4, nullptr);
  std::string title = "Log: " + ctx.workspace.log_path().string();
  GtkWidget* label = gtk_label_new(title.c_str());
  gtk_label_set_xalign(GTK_LABEL(label), 0.0f);
  gtk_label_set_ellipsize(GTK_LABEL(label), PANGO_ELLIPSIZE_START);
  GtkWidget* refresh = gtk_button_new_from_icon_name("view-refresh-symbolic", GTK_ICON_SIZE_BUTTON);
  gtk_widget_set_tooltip_text(refresh, "Refresh");
  g_signal_connect(refresh, "clicked", G_CALLBACK(+[](GtkButton*, gpointer data) {
    auto& c = *static_cast<AppContext*>(data);
    c.last_log_text.clear();
    refresh_log_view(c);
  }), &ctx);
  gtk_box_pack_start(GTK_BOX(top), label, TRUE, TRUE, 0);
  gtk_box_pack_start(GTK_BOX(top), refresh, FALSE, FALSE, 0);

  GtkWidget* view = make_text_view(ctx, ctx.log_buffer);
  gtk_text_view_set_editable(GTK_TEXT_VIEW(view), FALSE);
  gtk_text_view_set_cursor_visible(GTK_TEXT_VIEW(view), FALSE);
  gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(view), GTK_WRAP_WORD_CHAR);
  gtk_text_view_set_monospace(GTK_TEXT_VIEW(view), TRUE);
  g_log_view = view;
  g_signal_connect(view, "destroy", G_CALLBACK(+[](GtkWidget*, gpointer) { g_log_view = nullptr; }), nullptr);

  gtk_box_pack_start(GTK_BOX(box), top, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), scrolled(view), TRUE, TRUE, 0);
  ctx.last_log_text.clear();
  refresh_log_view(ctx);
  return box;
}

void start_log_refresh(AppContext& ctx) {
  if (!penenv::app::SettingsStore::instance().command_logging_enabled()) return;
  g_timeout_add(kLogRefreshMs, +[](gpointer data) -> gboolean {
    refresh_log_view(*static_cast<AppContext*>(data));
    return G_SOURCE_CONTINUE;
  }, &ctx);
}

} // namespace penenv::ui
