#pragma once

#include <filesystem>
#include <optional>
#include "ui/AppContext.hpp"

namespace penenv::ui {

// Ask whether to use the current directory or browse for one. nullopt when
// the user cancels.
std::optional<std::filesystem::path> choose_base_dir(GtkApplication* app);

// General, Shortcuts and Custom Commands pages. Changes are saved as made.
void show_settings_dialog(AppContext& ctx);

} // namespace penenv::ui
