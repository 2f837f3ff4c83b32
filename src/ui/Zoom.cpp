#include "ui/Zoom.hpp"
#include "app/Settings.hpp"
#include "util/Log.hpp"

#include <cstdio>

namespace penenv::ui {

using penenv::app::SettingsStore;

void apply_text_zoom(AppContext& ctx) {
  if (!ctx.text_css) {
    ctx.text_css = gtk_css_provider_new();
    gtk_style_context_add_provider_for_screen(gdk_screen_get_default(), GTK_STYLE_PROVIDER(ctx.text_css),
                                              GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
  }
  // CSS wants '.' as the decimal separator whatever LC_NUMERIC says
  char pt[G_ASCII_DTOSTR_BUF_SIZE];
  g_ascii_formatd(pt, sizeof(pt), "%.1f", kTextBasePt * SettingsStore::instance().text_zoom());
  char css[128];
  std::snprintf(css, sizeof(css), ".penenv-text { font-family: monospace; font-size: %spt; }", pt);
  GError* error = nullptr;
  if (!gtk_css_provider_load_from_data(ctx.text_css, css, -1, &error)) {
    PENENV_LOG_WARN("text zoom css rejected: %s", error ? error->message : "unknown");
    if (error) g_error_free(error);
  }
}

void apply_terminal_zoom(AppContext& ctx) {
  double scale = SettingsStore::instance().terminal_zoom();
  for (auto* term : ctx.terminals) vte_terminal_set_font_scale(term, scale);
}

static void persist() {
  std::string err;
  if (!SettingsStore::instance().save(err)) PENENV_LOG_WARN("%s", err.c_str());
}

void set_text_zoom(AppContext& ctx, double scale) {
  SettingsStore::instance().set_text_zoom(scale);
  apply_text_zoom(ctx);
  persist();
}

void set_terminal_zoom(AppContext& ctx, double scale) {
  SettingsStore::instance().set_terminal_zoom(scale);
  apply_terminal_zoom(ctx);
  persist();
}

// +1 zoom in, -1 zoom out, 0 not a zoom gesture
static int zoom_direction(GdkEventScroll* ev) {
  if (!(ev->state & GDK_CONTROL_MASK)) return 0;
  switch (ev->direction) {
    case GDK_SCROLL_UP: return 1;
    case GDK_SCROLL_DOWN: return -1;
    case GDK_SCROLL_SMOOTH:
      if (ev->delta_y < 0) return 1;
      if (ev->delta_y > 0) return -1;
      return 0;
    default: return 0;
  }
}

static gboolean on_text_scroll(GtkWidget*, GdkEventScroll* ev, gpointer data) {
  int dir = zoom_direction(ev);
  if (dir == 0) return FALSE;
  auto& ctx = *static_cast<AppContext*>(data);
  double cur = SettingsStore::instance().text_zoom();
  set_text_zoom(ctx, dir > 0 ? penenv::app::zoom_in(cur) : penenv::app::zoom_out(cur));
  return TRUE;
}

static gboolean on_terminal_scroll(GtkWidget*, GdkEventScroll* ev, gpointer data) {
  int dir = zoom_direction(ev);
  if (dir == 0) return FALSE;
  auto& ctx = *static_cast<AppContext*>(data);
  double cur = SettingsStore::instance().terminal_zoom();
  set_terminal_zoom(ctx, dir > 0 ? penenv::app::zoom_in(cur) : penenv::app::zoom_out(cur));
  return TRUE;
}

void connect_text_scroll_zoom(AppContext& ctx, GtkWidget* view) {
  gtk_widget_add_events(view, GDK_SCROLL_MASK | GDK_SMOOTH_SCROLL_MASK);
  g_signal_connect(view, "scroll-event", G_CALLBACK(on_text_scroll), &ctx);
}

void connect_terminal_scroll_zoom(AppContext& ctx, VteTerminal* term) {
  gtk_widget_add_events(GTK_WIDGET(term), GDK_SCROLL_MASK | GDK_SMOOTH_SCROLL_MASK);
  g_signal_connect(term, "scroll-event", G_CALLBACK(on_terminal_scroll), &ctx);
}

} // namespace penenv::ui
