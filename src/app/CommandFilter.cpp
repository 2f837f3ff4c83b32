#include "app/CommandFilter.hpp"
#include "util/BoyerMoore.hpp"

#include <algorithm>

namespace penenv::app {

using penenv::model::CommandTemplate;
using penenv::util::BoyerMooreSearch;

static bool matches_any(const CommandTemplate& t, const BoyerMooreSearch& bm) {
  return bm.matches(t.name) || bm.matches(t.description) ||
         bm.matches(t.command) || bm.matches(t.category);
}

bool template_matches(const CommandTemplate& t, std::string_view query) {
  if (query.empty()) return true;
  return matches_any(t, BoyerMooreSearch(query));
}

FilterResult filter_commands(const std::vector<CommandTemplate>& templates, std::string_view query) {
  FilterResult r;
  BoyerMooreSearch bm(query);
  for (std::size_t i = 0; i < templates.size(); ++i) {
    if (bm.empty() || matches_any(templates[i], bm)) {
      r.matches.push_back(i);
      r.categories.insert(templates[i].category);
    }
  }
  return r;
}

std::vector<std::string> categories_in_order(const std::vector<CommandTemplate>& templates) {
  std::vector<std::string> out;
  for (const auto& t : templates) {
    if (std::find(out.begin(), out.end(), t.category) == out.end()) out.push_back(t.category);
  }
  return out;
}

} // namespace penenv::app
