#pragma once

#include <functional>
#include <string>
#include "ui/AppContext.hpp"

namespace penenv::ui {

using TargetCallback = std::function<void(const std::string&)>;

// Combo of targets plus an insert button that passes the selection to on_insert.
GtkWidget* create_target_bar(AppContext& ctx, TargetCallback on_insert);

// Popover list of targets anchored at relative_to. on_pick runs with the
// chosen target; nothing runs when the popup is dismissed.
void show_target_popup(AppContext& ctx, GtkWidget* relative_to, TargetCallback on_pick);

} // namespace penenv::ui
