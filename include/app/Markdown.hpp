#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace penenv::app {

// A highlight range in character (code point) offsets from the start of the
// document, end exclusive. tag is one of h1..h6, bold, italic, code,
// code_block, link, list, blockquote.
struct MarkdownSpan {
  std::string tag;
  int start{};
  int end{};

  bool operator==(const MarkdownSpan&) const = default;
};

std::vector<MarkdownSpan> highlight_markdown(std::string_view text);

} // namespace penenv::app
