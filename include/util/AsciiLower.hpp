#pragma once

#include <array>
#include <string>
#include <string_view>

namespace penenv::util {

namespace detail {
constexpr std::array<unsigned char, 256> make_lower_table() {
  std::array<unsigned char, 256> t{};
  for (int i = 0; i < 256; ++i) {
    t[i] = (i >= 'A' && i <= 'Z') ? static_cast<unsigned char>(i + ('a' - 'A'))
                                  : static_cast<unsigned char>(i);
  }
  return t;
}
inline constexpr auto kLowerTable = make_lower_table();
} // namespace detail

// Locale-independent ASCII lowercase; bytes >= 0x80 pass through unchanged.
constexpr unsigned char ascii_lower(unsigned char c) { return detail::kLowerTable[c]; }

inline std::string ascii_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(ascii_lower(static_cast<unsigned char>(c)));
  return out;
}

inline std::string ascii_upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - ('a' - 'A'));
  }
  return out;
}

} // namespace penenv::util
