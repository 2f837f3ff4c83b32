#pragma once

#include "ui/AppContext.hpp"

namespace penenv::ui {

// Targets tab: plain editor over targets.txt, Ctrl+S saves and refreshes
// every target selector.
GtkWidget* create_targets_editor(AppContext& ctx);

// Notes view over the shared notes buffer with a target bar. Can be created
// more than once (split views); all instances edit the same text.
GtkWidget* create_notes_editor(AppContext& ctx);

// Read-only view of the command log with a refresh button.
GtkWidget* create_log_viewer(AppContext& ctx);

// Reload the command log into the log view when the file changed.
void refresh_log_view(AppContext& ctx);
// 2 s refresh timer for the log view; no-op when logging is disabled.
void start_log_refresh(AppContext& ctx);

// Write pending notes immediately and cancel the debounce timer.
void flush_notes(AppContext& ctx);

// Insert text at the cursor of a text view's buffer.
void insert_into_view(GtkTextView* view, const std::string& text);

} // namespace penenv::ui
