#pragma once

#include "app/Settings.hpp"
#include "ui/AppContext.hpp"

namespace penenv::ui {

// CPU bar, RAM bar and network graph for the header bar.
GtkWidget* create_monitors(AppContext& ctx);

void apply_monitor_visibility(AppContext& ctx, const penenv::app::MonitorVisibility& vis);

// Start the sampler thread and the 1 s redraw timer.
void start_monitors(AppContext& ctx);
void stop_monitors(AppContext& ctx);

} // namespace penenv::ui
