#include "util/BoyerMoore.hpp"

namespace penenv::util {

BoyerMooreSearch::BoyerMooreSearch(std::string_view pattern)
    : pattern_(ascii_lower(pattern)) {
  const int m = static_cast<int>(pattern_.size());
  for (int i = 0; i < ALPHABET_SIZE; ++i) bad_char_[i] = m;
  for (int i = 0; i < m - 1; ++i) {
    bad_char_[static_cast<unsigned char>(pattern_[i])] = m - 1 - i;
  }
}

int BoyerMooreSearch::search(std::string_view text) const {
  const int n = static_cast<int>(text.size());
  const int m = static_cast<int>(pattern_.size());
  if (m == 0) return 0;
  if (m > n) return -1;

  int i = 0;
  while (i <= n - m) {
    int j = m - 1;
    // pattern_ is stored lowercased, only the text side needs folding
    while (j >= 0 && ascii_lower(static_cast<unsigned char>(text[i + j])) ==
                         static_cast<unsigned char>(pattern_[j])) {
      --j;
    }
    if (j < 0) return i;
    int shift = bad_char_[ascii_lower(static_cast<unsigned char>(text[i + m - 1]))];
    i += (shift > 0) ? shift : 1;
  }
  return -1;
}

} // namespace penenv::util
