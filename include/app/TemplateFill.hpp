#pragma once

#include <string>
#include <string_view>

namespace penenv::app {

inline constexpr std::string_view kTargetPlaceholder = "{target}";
inline constexpr std::string_view kPortPlaceholder = "{port}";

bool needs_target(std::string_view command);

// Every {target} becomes target, every {port} becomes empty.
std::string fill_template(std::string_view command, std::string_view target);

// Text typed into a terminal for a template: the command and one trailing
// space, never a newline.
std::string insertion_text(std::string_view command);

std::string replace_all(std::string_view text, std::string_view from, std::string_view to);

} // namespace penenv::app
