#include "ui/TargetPicker.hpp"

namespace penenv::ui {

struct TargetBar {
  GtkComboBoxText* combo{};
  TargetCallback on_insert;
};

static void on_insert_clicked(GtkButton*, gpointer data) {
  auto* bar = static_cast<TargetBar*>(data);
  gchar* text = gtk_combo_box_text_get_active_text(bar->combo);
  if (text && *text) bar->on_insert(text);
  g_free(text);
}

GtkWidget* create_target_bar(AppContext& ctx, TargetCallback on_insert) {
  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
  GtkWidget* label = gtk_label_new("Target:");
  GtkWidget* combo = gtk_combo_box_text_new();
  gtk_widget_set_hexpand(combo, TRUE);
  GtkWidget* insert = gtk_button_new_from_icon_name("list-add-symbolic", GTK_ICON_SIZE_BUTTON);
  gtk_widget_set_tooltip_text(insert, "Insert Target");
  gtk_button_set_relief(GTK_BUTTON(insert), GTK_RELIEF_NONE);

  gtk_box_pack_start(GTK_BOX(box), label, FALSE, FALSE, 0);
  gtk_box_pack_start(GTK_BOX(box), combo, TRUE, TRUE, 0);
  gtk_box_pack_start(GTK_BOX(box), insert, FALSE, FALSE, 0);

  auto* bar = new TargetBar{GTK_COMBO_BOX_TEXT(combo), std::move(on_insert)};
  g_object_set_data_full(G_OBJECT(box), "penenv-target-bar", bar,
                         [](gpointer p) { delete static_cast<TargetBar*>(p); });
  g_signal_connect(insert, "clicked", G_CALLBACK(on_insert_clicked), bar);

  track_target_combo(ctx, GTK_COMBO_BOX_TEXT(combo));
  for (const auto& t : current_targets(ctx)) gtk_combo_box_text_append_text(GTK_COMBO_BOX_TEXT(combo), t.c_str());
  gtk_combo_box_set_active(GTK_COMBO_BOX(combo), 0);
  return box;
}

struct TargetPopup {
  GtkWidget* popover{};
  TargetCallback on_pick;
};

static void on_target_row(GtkListBox*, GtkListBoxRow* row, gpointer data) {
  auto* popup = static_cast<TargetPopup*>(data);
  auto* text = static_cast<const char*>(g_object_get_data(G_OBJECT(row), "penenv-target"));
  // copy out before the popover (and with it popup) goes away
  std::string target = text ? text : "";
  TargetCallback cb = popup->on_pick;
  gtk_widget_destroy(popup->popover);
  if (!target.empty()) cb(target);
}

void show_target_popup(AppContext& ctx, GtkWidget* relative_to, TargetCallback on_pick) {
  auto targets = current_targets(ctx);
  GtkWidget* popover = gtk_popover_new(relative_to);
  GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
  g_object_set(box, "margin", 8, nullptr);
  gtk_container_add(GTK_CONTAINER(popover), box);

  GtkWidget* title = gtk_label_new(nullptr);
  gtk_label_set_markup(GTK_LABEL(title), "<b>Select Target</b>");
  gtk_box_pack_start(GTK_BOX(box), title, FALSE, FALSE, 0);

  if (targets.empty()) {
    gtk_box_pack_start(GTK_BOX(box), gtk_label_new("No targets defined in targets.txt"), FALSE, FALSE, 0);
    gtk_widget_show_all(popover);
    gtk_popover_popup(GTK_POPOVER(popover));
    return;
  }

  GtkWidget* scrolled = gtk_scrolled_window_new(nullptr, nullptr);
  gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scrolled), GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
  gtk_scrolled_window_set_max_content_height(GTK_SCROLLED_WINDOW(scrolled), 300);
  gtk_scrolled_window_set_propagate_natural_height(GTK_SCROLLED_WINDOW(scrolled), TRUE);
  GtkWidget* list = gtk_list_box_new();
  gtk_list_box_set_activate_on_single_click(GTK_LIST_BOX(list), TRUE);
  for (const auto& t : targets) {
    GtkWidget* row = gtk_list_box_row_new();
    GtkWidget* label = gtk_label_new(t.c_str());
    gtk_label_set_xalign(GTK_LABEL(label), 0.0f);
    g_object_set(label, "margin", 4, nullptr);
    gtk_container_add(GTK_CONTAINER(row), label);
    g_object_set_data_full(G_OBJECT(row), "penenv-target", g_strdup(t.c_str()), g_free);
    gtk_container_add(GTK_CONTAINER(list), row);
  }
  gtk_container_add(GTK_CONTAINER(scrolled), list);
  gtk_box_pack_start(GTK_BOX(box), scrolled, TRUE, TRUE, 0);

  auto* popup = new TargetPopup{popover, std::move(on_pick)};
  g_object_set_data_full(G_OBJECT(popover), "penenv-target-popup", popup,
                         [](gpointer p) { delete static_cast<TargetPopup*>(p); });
  g_signal_connect(list, "row-activated", G_CALLBACK(on_target_row), popup);
  g_signal_connect(popover, "closed", G_CALLBACK(+[](GtkPopover* p, gpointer) {
    gtk_widget_destroy(GTK_WIDGET(p));
  }), nullptr);

  gtk_widget_show_all(popover);
  gtk_popover_popup(GTK_POPOVER(popover));
  GtkListBoxRow* first = gtk_list_box_get_row_at_index(GTK_LIST_BOX(list), 0);
  if (first) {
    gtk_list_box_select_row(GTK_LIST_BOX(list), first);
    gtk_widget_grab_focus(GTK_WIDGET(first));
  }
}

} // namespace penenv::ui
