// Helpers for reading /proc with an optional root remap (tests)
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace penenv::util {

// Map an absolute /proc path below PENENV_PROC_ROOT when that is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read a whole file. std::nullopt when it cannot be opened or read.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Call fn(line) for every line of text, without the trailing newline.
template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    fn(text.substr(start, end - start));
    start = end + 1;
  }
}

} // namespace penenv::util
