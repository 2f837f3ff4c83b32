#include "ui/Monitors.hpp"

#include <algorithm>
#include <cstdio>
#include <string>

#include "util/Log.hpp"

namespace penenv::ui {

static constexpr guint kRedrawMs = 1000;
static constexpr int kBarWidth = 64;
static constexpr int kGraphWidth = 170;
static constexpr int kMonitorHeight = 34;

// Latest values as seen by the GTK thread
struct MonitorState {
  uint64_t seq{};
  double cpu_pct{};
  double mem_pct{};
  bool cpu_ok{};
  bool mem_ok{};
};

static MonitorState g_state;
static guint g_timer = 0;

static void set_rgb(cairo_t* cr, double r, double g, double b, double a = 1.0) {
  cairo_set_source_rgba(cr, r, g, b, a);
}

static void bar_colour(cairo_t* cr, double pct) {
  if (pct >= 90.0) set_rgb(cr, 0.90, 0.25, 0.25);
  else if (pct >= 70.0) set_rgb(cr, 0.95, 0.70, 0.20);
  else set_rgb(cr, 0.30, 0.75, 0.40);
}

static void draw_text(cairo_t* cr, double x, double y, const std::string& text, double size) {
  cairo_select_font_face(cr, "monospace", CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_BOLD);
  cairo_set_font_size(cr, size);
  cairo_move_to(cr, x, y);
  cairo_show_text(cr, text.c_str());
}

// Vertical fill from the bottom with "<label> <pct>%" on top.
static void draw_bar(cairo_t* cr, int w, int h, const char* label, double pct, bool ok) {
  set_rgb(cr, 0.15, 0.15, 0.15);
  cairo_rectangle(cr, 0, 0, w, h);
  cairo_fill(cr);
  double clamped = std::clamp(pct, 0.0, 100.0);
  double fill = (h - 2) * clamped / 100.0;
  bar_colour(cr, clamped);
  cairo_rectangle(cr, 1, h - 1 - fill, w - 2, fill);
  cairo_fill(cr);
  set_rgb(cr, 0.4, 0.4, 0.4);
  cairo_set_line_width(cr, 1.0);
  cairo_rectangle(cr, 0.5, 0.5, w - 1, h - 1);
  cairo_stroke(cr);

  char buf[32];
  if (ok) std::snprintf(buf, sizeof(buf), "%s %.0f%%", label, clamped);
  else std::snprintf(buf, sizeof(buf), "%s --", label);
  set_rgb(cr, 1.0, 1.0, 1.0);
  draw_text(cr, 4, h / 2.0 + 4, buf, 10);
}

static gboolean on_draw_cpu(GtkWidget* w, cairo_t* cr, gpointer) {
  draw_bar(cr, gtk_widget_get_allocated_width(w), gtk_widget_get_allocated_height(w), "CPU", g_state.cpu_pct,
           g_state.cpu_ok);
  return FALSE;
}

static gboolean on_draw_ram(GtkWidget* w, cairo_t* cr, gpointer) {
  draw_bar(cr, gtk_widget_get_allocated_width(w), gtk_widget_get_allocated_height(w), "RAM", g_state.mem_pct,
           g_state.mem_ok);
  return FALSE;
}

static void draw_series(cairo_t* cr, const std::deque<penenv::app::NetSample>& samples, bool rx, int w, int h,
                        double max) {
  if (samples.size() < 2) return;
  double step = static_cast<double>(w) / (penenv::app::NetHistory::kCapacity - 1);
  // newest sample sits at the right edge
  double x0 = w - step * static_cast<double>(samples.size() - 1);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    double v = rx ? samples[i].rx_kbps : samples[i].tx_kbps;
    double x = x0 + step * static_cast<double>(i);
    double y = h - 1 - (h - 2) * std::min(v / max, 1.0);
    if (i == 0) cairo_move_to(cr, x, y);
    else cairo_line_to(cr, x, y);
  }
  cairo_stroke(cr);
}

static gboolean on_draw_net(GtkWidget* w, cairo_t* cr, gpointer data) {
  auto& ctx = *static_cast<AppContext*>(data);
  int width = gtk_widget_get_allocated_width(w);
  int height = gtk_widget_get_allocated_height(w);
  set_rgb(cr, 0.15, 0.15, 0.15);
  cairo_rectangle(cr, 0, 0, width, height);
  cairo_fill(cr);

  const auto& hist = ctx.net_history;
  double max = hist.max_value();
  cairo_set_line_width(cr, 1.5);
  set_rgb(cr, 0.30, 0.85, 0.40);
  draw_series(cr, hist.samples(), true, width, height, max);
  set_rgb(cr, 0.35, 0.60, 0.95);
  draw_series(cr, hist.samples(), false, width, height, max);

  auto last = hist.latest();
  std::string rx = "↓" + penenv::app::format_rate(last.rx_kbps);
  std::string tx = "↑" + penenv::app::format_rate(last.tx_kbps);
  set_rgb(cr, 0.30, 0.85, 0.40);
  draw_text(cr, 4, 12, rx, 9);
  set_rgb(cr, 0.35, 0.60, 0.95);
  draw_text(cr, 4, height - 4, tx, 9);

  set_rgb(cr, 0.4, 0.4, 0.4);
  cairo_set_line_width(cr, 1.0);
  cairo_rectangle(cr, 0.5, 0.5, width - 1, height - 1);
  cairo_stroke(cr);
  return FALSE;
}

static GtkWidget* monitor_area(int width, const char* tooltip) {
  GtkWidget* area = gtk_drawing_area_new();
  gtk_widget_set_size_request(area, width, kMonitorHeight);
  gtk_widget_set_valign(area, GTK_ALIGN_CENTER);
  gtk_widget_set_tooltip_text(area, tooltip);
  // visibility comes from settings, not from show_all on the window
  gtk_widget_set_no_show_all(area, TRUE);
  return area;
}

GtkWidget* create_monitors(AppContext& ctx) {
  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
  ctx.cpu_monitor = monitor_area(kBarWidth, "CPU usage");
  ctx.ram_monitor = monitor_area(kBarWidth, "Memory usage");
  ctx.net_monitor = monitor_area(kGraphWidth, "Network (rx green, tx blue)");
  g_signal_connect(ctx.cpu_monitor, "draw", G_CALLBACK(on_draw_cpu), nullptr);
  g_signal_connect(ctx.ram_monitor, "draw", G_CALLBACK(on_draw_ram), nullptr);
  g_signal_connect(ctx.net_monitor, "draw", G_CALLBACK(on_draw_net), &ctx);
  gtk_box_pack_start(GTK_BOX(box), ctx.cpu_monitor, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), ctx.ram_monitor, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), ctx.net_monitor, FALSE, FALSE, 0);
  ctx.monitors = box;
  return box;
}

void apply_monitor_visibility(AppContext& ctx, const penenv::app::MonitorVisibility& vis) {
  if (!ctx.monitors) return;
  gtk_widget_set_visible(ctx.cpu_monitor, vis.show_cpu);
  gtk_widget_set_visible(ctx.ram_monitor, vis.show_ram);
  gtk_widget_set_visible(ctx.net_monitor, vis.show_network);
}

static gboolean on_redraw(gpointer data) {
  auto& ctx = *static_cast<AppContext*>(data);
  auto snap = ctx.monitor_buffers.front();
  if (snap.seq != g_state.seq) {
    g_state.seq = snap.seq;
    g_state.cpu_ok = snap.cpu_ok;
    g_state.mem_ok = snap.mem_ok;
    g_state.cpu_pct = snap.cpu.usage_pct;
    g_state.mem_pct = snap.mem.used_pct;
    if (snap.net_ok) ctx.net_history.push_bps(snap.net.agg_rx_bps, snap.net.agg_tx_bps);
  }
  for (GtkWidget* w : {ctx.cpu_monitor, ctx.ram_monitor, ctx.net_monitor})
    if (w && gtk_widget_get_visible(w)) gtk_widget_queue_draw(w);
  return G_SOURCE_CONTINUE;
}

void start_monitors(AppContext& ctx) {
  if (!ctx.sampler) ctx.sampler = std::make_unique<penenv::app::Sampler>(ctx.monitor_buffers);
  ctx.sampler->start();
  if (!g_timer) g_timer = g_timeout_add(kRedrawMs, on_redraw, &ctx);
  PENENV_LOG_DEBUG("monitors started");
}

void stop_monitors(AppContext& ctx) {
  if (g_timer) {
    g_source_remove(g_timer);
    g_timer = 0;
  }
  if (ctx.sampler) ctx.sampler->stop();
}

} // namespace penenv::ui
