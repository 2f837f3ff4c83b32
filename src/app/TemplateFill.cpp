#include "app/TemplateFill.hpp"

namespace penenv::app {

std::string replace_all(std::string_view text, std::string_view from, std::string_view to) {
  std::string out;
  if (from.empty()) return std::string(text);
  out.reserve(text.size());
  std::size_t pos = 0;
  while (true) {
    auto hit = text.find(from, pos);
    if (hit == std::string_view::npos) break;
    out.append(text.substr(pos, hit - pos));
    out.append(to);
    pos = hit + from.size();
  }
  out.append(text.substr(pos));
  return out;
}

bool needs_target(std::string_view command) {
  return command.find(kTargetPlaceholder) != std::string_view::npos;
}

std::string fill_template(std::string_view command, std::string_view target) {
  auto filled = replace_all(command, kTargetPlaceholder, target);
  return replace_all(filled, kPortPlaceholder, "");
}

std::string insertion_text(std::string_view command) {
  std::string out(command);
  out.push_back(' ');
  return out;
}

} // namespace penenv::app
