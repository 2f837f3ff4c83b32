#pragma once

#include <gtk/gtk.h>
#include <vte/vte.h>

#include <memory>
#include <string>
#include <vector>

#include "app/NetHistory.hpp"
#include "app/Sampler.hpp"
#include "app/SnapshotBuffers.hpp"
#include "app/Workspace.hpp"
#include "model/CommandTemplate.hpp"

namespace penenv::ui {

// Notebook page order of the fixed tabs
namespace tabs {
inline constexpr int kTargets = 0;
inline constexpr int kNotes = 1;
inline constexpr int kLog = 2;
} // namespace tabs

// Widgets and state shared by every part of the main window. Lives for the
// whole GtkApplication run; widgets unregister themselves on destroy.
struct AppContext {
  GtkApplication* app{nullptr};
  GtkWindow* window{nullptr};
  GtkNotebook* notebook{nullptr};
  penenv::app::Workspace workspace;

  // Shared notes buffer so split views and the Notes tab edit the same text
  GtkTextBuffer* notes_buffer{nullptr};
  GtkTextBuffer* targets_buffer{nullptr};
  GtkTextBuffer* log_buffer{nullptr};

  std::vector<GtkWidget*> text_views;     // zoomed with the text scale
  std::vector<VteTerminal*> terminals;    // zoomed with the terminal scale
  std::vector<GtkComboBoxText*> target_combos;
  std::vector<penenv::model::CommandTemplate> templates;

  GtkCssProvider* text_css{nullptr};
  GtkWidget* monitors{nullptr};
  GtkWidget* cpu_monitor{nullptr};
  GtkWidget* ram_monitor{nullptr};
  GtkWidget* net_monitor{nullptr};

  penenv::app::SnapshotBuffers monitor_buffers;
  std::unique_ptr<penenv::app::Sampler> sampler;
  penenv::app::NetHistory net_history;

  int shell_counter{0};
  guint notes_save_source{0};
  std::string last_log_text;
};

AppContext& app_context();

void track_text_view(AppContext& ctx, GtkWidget* view);
void track_terminal(AppContext& ctx, VteTerminal* term);
void track_target_combo(AppContext& ctx, GtkComboBoxText* combo);

std::vector<std::string> current_targets(const AppContext& ctx);
// Reload targets.txt into every combo, keeping each selection when it still exists.
void refresh_target_combos(AppContext& ctx);
void reload_templates(AppContext& ctx);

// Ctrl (plus Shift when shift is set) and the named key. Letter case of the
// name is ignored so "T" with shift matches Ctrl+Shift+T.
bool shortcut_matches(const GdkEventKey* ev, const std::string& key_name, bool shift);

// Returns an owned C string vector for GLib calls, e.g. vte spawn env.
struct CStrv {
  std::vector<std::string> items;
  std::vector<char*> ptrs;
  explicit CStrv(std::vector<std::string> v);
  CStrv(const CStrv&) = delete;
  CStrv& operator=(const CStrv&) = delete;
  CStrv(CStrv&&) = delete;
  CStrv& operator=(CStrv&&) = delete;
  char** data() { return ptrs.data(); }
};

} // namespace penenv::ui
