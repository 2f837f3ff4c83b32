#pragma once

#include <string>
#include "ui/AppContext.hpp"

namespace penenv::ui {

// Terminal running bash in the base directory, with target bar and command
// drawer. logging selects whether this shell writes the command log.
GtkWidget* create_shell_view(AppContext& ctx, bool logging);

// Append "Shell N" and switch to it.
void open_shell_tab(AppContext& ctx, bool logging);
// Append a notes | shell split page and switch to it.
void open_split_tab(AppContext& ctx);

// Tab label that renames on double click; closable adds a close button
// removing page from the notebook.
GtkWidget* create_tab_label(AppContext& ctx, GtkWidget* page, const std::string& text, bool closable);

// Focus the terminal of a shell or split page; no-op for other pages.
void focus_terminal_in(GtkWidget* page);

} // namespace penenv::ui
