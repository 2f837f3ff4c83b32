#include "ui/CommandDrawer.hpp"

#include <string>

#include "app/CommandFilter.hpp"
#include "app/Settings.hpp"
#include "app/TemplateFill.hpp"
#include "ui/TargetPicker.hpp"

namespace penenv::ui {

static constexpr int kDrawerWidth = 340;

struct Drawer {
  AppContext* ctx{};
  VteTerminal* term{};
  GtkWidget* revealer{};
  GtkWidget* search{};
  GtkWidget* list{};
  penenv::app::FilterResult filter;
};

static Drawer* drawer_of(GtkWidget* w) {
  return static_cast<Drawer*>(g_object_get_data(G_OBJECT(w), "penenv-drawer"));
}

static void feed(VteTerminal* term, const std::string& text) {
  vte_terminal_feed_child(term, text.c_str(), static_cast<gssize>(text.size()));
  gtk_widget_grab_focus(GTK_WIDGET(term));
}

static gboolean row_visible(GtkListBoxRow* row, gpointer data) {
  auto* d = static_cast<Drawer*>(data);
  auto* category = static_cast<const char*>(g_object_get_data(G_OBJECT(row), "penenv-category"));
  if (category) return d->filter.categories.count(category) ? TRUE : FALSE;
  auto idx = static_cast<std::size_t>(GPOINTER_TO_SIZE(g_object_get_data(G_OBJECT(row), "penenv-index")));
  for (auto m : d->filter.matches)
    if (m == idx) return TRUE;
  return FALSE;
}

static void apply_filter(Drawer* d) {
  const char* q = gtk_entry_get_text(GTK_ENTRY(d->search));
  d->filter = penenv::app::filter_commands(d->ctx->templates, q ? q : "");
  gtk_list_box_invalidate_filter(GTK_LIST_BOX(d->list));
}

static GtkWidget* category_row(const std::string& category) {
  GtkWidget* row = gtk_list_box_row_new();
  gtk_list_box_row_set_activatable(GTK_LIST_BOX_ROW(row), FALSE);
  gtk_list_box_row_set_selectable(GTK_LIST_BOX_ROW(row), FALSE);
  GtkWidget* label = gtk_label_new(nullptr);
  gchar* markup = g_markup_printf_escaped("<b>%s</b>", category.c_str());
  gtk_label_set_markup(GTK_LABEL(label), markup);
  g_free(markup);
  gtk_label_set_xalign(GTK_LABEL(label), 0.0f);
  g_object_set(label, "margin-top", 8, "margin-start", 6, "margin-bottom", 2, nullptr);
  gtk_container_add(GTK_CONTAINER(row), label);
  g_object_set_data_full(G_OBJECT(row), "penenv-category", g_strdup(category.c_str()), g_free);
  return row;
}

static GtkWidget* command_row(const penenv::model::CommandTemplate& t, std::size_t idx) {
  GtkWidget* row = gtk_list_box_row_new();
  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 2);
  g_object_set(box, "margin-start", 14, "margin-end", 6, "margin-top", 3, "margin-bottom", 3, nullptr);
  GtkWidget* name = gtk_label_new(t.name.c_str());
  gtk_label_set_xalign(GTK_LABEL(name), 0.0f);
  GtkWidget* desc = gtk_label_new(t.description.c_str());
  gtk_label_set_xalign(GTK_LABEL(desc), 0.0f);
  gtk_label_set_ellipsize(GTK_LABEL(desc), PANGO_ELLIPSIZE_END);
  gtk_style_context_add_class(gtk_widget_get_style_context(desc), "dim-label");
  gtk_box_pack_start(GTK_BOX(box), name, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), desc, FALSE, FALSE, 0);
  gtk_container_add(GTK_CONTAINER(row), box);
  std::string tip = t.description + "\n\nCommand: " + t.command;
  gtk_widget_set_tooltip_text(row, tip.c_str());
  g_object_set_data(G_OBJECT(row), "penenv-index", GSIZE_TO_POINTER(idx));
  return row;
}

// Rows are rebuilt on every open so edits to custom commands show up.
static void populate(Drawer* d) {
  GList* children = gtk_container_get_children(GTK_CONTAINER(d->list));
  for (GList* it = children; it; it = it->next) gtk_widget_destroy(GTK_WIDGET(it->data));
  g_list_free(children);

  const auto& templates = d->ctx->templates;
  for (const auto& category : penenv::app::categories_in_order(templates)) {
    gtk_container_add(GTK_CONTAINER(d->list), category_row(category));
    for (std::size_t i = 0; i < templates.size(); ++i)
      if (templates[i].category == category) gtk_container_add(GTK_CONTAINER(d->list), command_row(templates[i], i));
  }
  gtk_widget_show_all(d->list);
  apply_filter(d);
}

static void on_row_activated(GtkListBox*, GtkListBoxRow* row, gpointer data) {
  auto* d = static_cast<Drawer*>(data);
  if (g_object_get_data(G_OBJECT(row), "penenv-category")) return;
  auto idx = static_cast<std::size_t>(GPOINTER_TO_SIZE(g_object_get_data(G_OBJECT(row), "penenv-index")));
  if (idx >= d->ctx->templates.size()) return;
  std::string command = d->ctx->templates[idx].command;
  VteTerminal* term = d->term;
  set_drawer_open(d->revealer, false);

  if (!penenv::app::needs_target(command) || current_targets(*d->ctx).empty()) {
    feed(term, penenv::app::insertion_text(command));
    return;
  }
  show_target_popup(*d->ctx, GTK_WIDGET(term), [term, command](const std::string& target) {
    feed(term, penenv::app::insertion_text(penenv::app::fill_template(command, target)));
  });
}

static gboolean on_drawer_key(GtkWidget*, GdkEventKey* ev, gpointer data) {
  auto* d = static_cast<Drawer*>(data);
  if (ev->keyval == GDK_KEY_Escape) {
    set_drawer_open(d->revealer, false);
    gtk_widget_grab_focus(GTK_WIDGET(d->term));
    return TRUE;
  }
  auto keys = penenv::app::SettingsStore::instance().shortcuts();
  if (shortcut_matches(ev, keys.toggle_drawer, false)) {
    set_drawer_open(d->revealer, false);
    gtk_widget_grab_focus(GTK_WIDGET(d->term));
    return TRUE;
  }
  return FALSE;
}

static gboolean on_search_key(GtkWidget*, GdkEventKey* ev, gpointer data) {
  auto* d = static_cast<Drawer*>(data);
  if (ev->keyval != GDK_KEY_Down) return FALSE;
  for (int i = 0;; ++i) {
    GtkListBoxRow* row = gtk_list_box_get_row_at_index(GTK_LIST_BOX(d->list), i);
    if (!row) break;
    if (gtk_widget_get_child_visible(GTK_WIDGET(row)) && gtk_list_box_row_get_activatable(row)) {
      gtk_list_box_select_row(GTK_LIST_BOX(d->list), row);
      gtk_widget_grab_focus(GTK_WIDGET(row));
      return TRUE;
    }
  }
  return TRUE;
}

GtkWidget* create_command_drawer(AppContext& ctx, VteTerminal* term) {
  auto* d = new Drawer{};
  d->ctx = &ctx;
  d->term = term;

  d->revealer = gtk_revealer_new();
  gtk_revealer_set_transition_type(GTK_REVEALER(d->revealer), GTK_REVEALER_TRANSITION_TYPE_SLIDE_LEFT);
  gtk_revealer_set_reveal_child(GTK_REVEALER(d->revealer), FALSE);
  g_object_set_data_full(G_OBJECT(d->revealer), "penenv-drawer", d, [](gpointer p) { delete static_cast<Drawer*>(p); });

  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
  gtk_widget_set_size_request(box, kDrawerWidth, -1);
  g_object_set(box, "margin", 6, nullptr);
  GtkWidget* title = gtk_label_new(nullptr);
  gtk_label_set_markup(GTK_LABEL(title), "<b>Commands</b>");
  gtk_label_set_xalign(GTK_LABEL(title), 0.0f);

  d->search = gtk_search_entry_new();
  gtk_entry_set_placeholder_text(GTK_ENTRY(d->search), "Search commands...");
  g_signal_connect(d->search, "search-changed", G_CALLBACK(+[](GtkSearchEntry*, gpointer p) {
    apply_filter(static_cast<Drawer*>(p));
  }), d);
  g_signal_connect(d->search, "key-press-event", G_CALLBACK(on_search_key), d);

  d->list = gtk_list_box_new();
  gtk_list_box_set_selection_mode(GTK_LIST_BOX(d->list), GTK_SELECTION_SINGLE);
  gtk_list_box_set_filter_func(GTK_LIST_BOX(d->list), row_visible, d, nullptr);
  g_signal_connect(d->list, "row-activated", G_CALLBACK(on_row_activated), d);

  GtkWidget* sw = gtk_scrolled_window_new(nullptr, nullptr);
  gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(sw), GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
  gtk_widget_set_vexpand(sw, TRUE);
  gtk_container_add(GTK_CONTAINER(sw), d->list);

  gtk_box_pack_start(GTK_BOX(box), title, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), d->search, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), sw, TRUE, TRUE, 0);
  gtk_container_add(GTK_CONTAINER(d->revealer), box);
  g_signal_connect(box, "key-press-event", G_CALLBACK(on_drawer_key), d);
  return d->revealer;
}

bool drawer_open(GtkWidget* drawer) {
  return gtk_revealer_get_reveal_child(GTK_REVEALER(drawer));
}

void set_drawer_open(GtkWidget* drawer, bool open) {
  Drawer* d = drawer_of(drawer);
  if (!d) return;
  if (open) {
    populate(d);
    gtk_entry_set_text(GTK_ENTRY(d->search), "");
    gtk_revealer_set_reveal_child(GTK_REVEALER(drawer), TRUE);
    gtk_widget_grab_focus(d->search);
  } else {
    gtk_revealer_set_reveal_child(GTK_REVEALER(drawer), FALSE);
  }
}

void toggle_drawer(GtkWidget* drawer) {
  set_drawer_open(drawer, !drawer_open(drawer));
}

} // namespace penenv::ui
