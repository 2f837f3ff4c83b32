#pragma once

#include "ui/AppContext.hpp"

namespace penenv::ui {

// Base font size in points for editor text at scale 1.0
inline constexpr double kTextBasePt = 11.0;

void apply_text_zoom(AppContext& ctx);
void apply_terminal_zoom(AppContext& ctx);

// Set, apply to every tracked widget and persist.
void set_text_zoom(AppContext& ctx, double scale);
void set_terminal_zoom(AppContext& ctx, double scale);

// Ctrl+scroll handlers; attach to a text view or a terminal.
void connect_text_scroll_zoom(AppContext& ctx, GtkWidget* view);
void connect_terminal_scroll_zoom(AppContext& ctx, VteTerminal* term);

} // namespace penenv::ui
