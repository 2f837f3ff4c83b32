#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "model/CommandTemplate.hpp"

namespace penenv::app {

struct FilterResult {
  std::vector<std::size_t> matches;  // indices into the template list, in order
  std::set<std::string> categories;  // categories with at least one match
};

// Case-insensitive substring match over name, description, command and
// category. An empty query matches everything.
bool template_matches(const penenv::model::CommandTemplate& t, std::string_view query);
FilterResult filter_commands(const std::vector<penenv::model::CommandTemplate>& templates,
                             std::string_view query);

// Category names in first-seen order.
std::vector<std::string> categories_in_order(const std::vector<penenv::model::CommandTemplate>& templates);

} // namespace penenv::app
