#pragma once

#include "ui/AppContext.hpp"

namespace penenv::ui {

// Build and show the main window for ctx.workspace. Settings and templates
// must already be loaded.
void build_main_window(AppContext& ctx);

} // namespace penenv::ui
