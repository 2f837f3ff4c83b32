#pragma once

#include "ui/AppContext.hpp"

namespace penenv::ui {

// Searchable list of command templates beside a terminal. Activating an
// entry types it into term; the drawer then closes.
GtkWidget* create_command_drawer(AppContext& ctx, VteTerminal* term);

bool drawer_open(GtkWidget* drawer);
void set_drawer_open(GtkWidget* drawer, bool open);
void toggle_drawer(GtkWidget* drawer);

} // namespace penenv::ui
