#pragma once
#include <string>

namespace penenv::model {

// A named shell command; command may contain {target} and {port}.
struct CommandTemplate {
  std::string name;
  std::string command;
  std::string description;
  std::string category;

  bool operator==(const CommandTemplate&) const = default;
};

} // namespace penenv::model
