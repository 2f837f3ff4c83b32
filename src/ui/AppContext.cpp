#include "ui/AppContext.hpp"
#include "app/CommandStore.hpp"
#include "util/Log.hpp"

#include <algorithm>

namespace penenv::ui {

AppContext& app_context() {
  static AppContext ctx;
  return ctx;
}

template <typename T>
static void forget_on_destroy(GtkWidget* w, std::vector<T*>& list) {
  g_signal_connect(w, "destroy", G_CALLBACK(+[](GtkWidget* widget, gpointer data) {
    auto* vec = static_cast<std::vector<T*>*>(data);
    vec->erase(std::remove(vec->begin(), vec->end(), reinterpret_cast<T*>(widget)), vec->end());
  }), &list);
}

void track_text_view(AppContext& ctx, GtkWidget* view) {
  gtk_style_context_add_class(gtk_widget_get_style_context(view), "penenv-text");
  ctx.text_views.push_back(view);
  forget_on_destroy(view, ctx.text_views);
}

void track_terminal(AppContext& ctx, VteTerminal* term) {
  ctx.terminals.push_back(term);
  forget_on_destroy(GTK_WIDGET(term), ctx.terminals);
}

void track_target_combo(AppContext& ctx, GtkComboBoxText* combo) {
  ctx.target_combos.push_back(combo);
  forget_on_destroy(GTK_WIDGET(combo), ctx.target_combos);
}

std::vector<std::string> current_targets(const AppContext& ctx) {
  return penenv::app::load_targets(ctx.workspace.targets_path());
}

void refresh_target_combos(AppContext& ctx) {
  auto targets = current_targets(ctx);
  for (auto* combo : ctx.target_combos) {
    gchar* active = gtk_combo_box_text_get_active_text(combo);
    std::string keep = active ? active : "";
    g_free(active);
    gtk_combo_box_text_remove_all(combo);
    int select = targets.empty() ? -1 : 0;
    for (std::size_t i = 0; i < targets.size(); ++i) {
      gtk_combo_box_text_append_text(combo, targets[i].c_str());
      if (!keep.empty() && targets[i] == keep) select = static_cast<int>(i);
    }
    gtk_combo_box_set_active(GTK_COMBO_BOX(combo), select);
  }
  PENENV_LOG_DEBUG("reloaded %zu targets into %zu selectors", targets.size(), ctx.target_combos.size());
}

void reload_templates(AppContext& ctx) {
  ctx.templates = penenv::app::load_command_templates(penenv::app::custom_commands_path());
}

bool shortcut_matches(const GdkEventKey* ev, const std::string& key_name, bool shift) {
  if (key_name.empty()) return false;
  GdkModifierType mods = static_cast<GdkModifierType>(ev->state & gtk_accelerator_get_default_mod_mask());
  bool ctrl = (mods & GDK_CONTROL_MASK) != 0;
  bool has_shift = (mods & GDK_SHIFT_MASK) != 0;
  if (!ctrl || has_shift != shift) return false;
  guint want = gdk_keyval_from_name(key_name.c_str());
  if (want == GDK_KEY_VoidSymbol) return false;
  return gdk_keyval_to_lower(ev->keyval) == gdk_keyval_to_lower(want);
}

CStrv::CStrv(std::vector<std::string> v) : items(std::move(v)) {
  ptrs.reserve(items.size() + 1);
  for (auto& s : items) ptrs.push_back(s.data());
  ptrs.push_back(nullptr);
}

} // namespace penenv::ui
