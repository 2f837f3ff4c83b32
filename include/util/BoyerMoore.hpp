#pragma once

#include <string>
#include <string_view>
#include "util/AsciiLower.hpp"

namespace penenv::util {

// Boyer-Moore-Horspool literal search, ASCII case-insensitive.
// Used by the command drawer to match a query against template fields.
class BoyerMooreSearch {
public:
  explicit BoyerMooreSearch(std::string_view pattern);

  // Position of the first match, or -1. An empty pattern matches at 0.
  [[nodiscard]] int search(std::string_view text) const;
  [[nodiscard]] bool matches(std::string_view text) const { return search(text) >= 0; }
  [[nodiscard]] bool empty() const { return pattern_.empty(); }

private:
  static constexpr int ALPHABET_SIZE = 256;

  int bad_char_[ALPHABET_SIZE]{};
  std::string pattern_;
};

} // namespace penenv::util
