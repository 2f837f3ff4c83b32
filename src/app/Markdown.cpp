#include "app/Markdown.hpp"

namespace penenv::app {

// Decode UTF-8 into code points; invalid bytes map to U+FFFD one by one.
static std::u32string decode_utf8(std::string_view s) {
  std::u32string out;
  out.reserve(s.size());
  std::size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    int len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
    if (len == 0 || i + len > s.size()) { out.push_back(0xFFFD); ++i; continue; }
    char32_t cp = len == 1 ? c : len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
    bool ok = true;
    for (int k = 1; k < len; ++k) {
      unsigned char cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (!ok) { out.push_back(0xFFFD); ++i; continue; }
    out.push_back(cp);
    i += static_cast<std::size_t>(len);
  }
  return out;
}

static std::size_t find_from(const std::u32string& line, std::size_t from, std::u32string_view needle) {
  if (from > line.size()) return std::u32string::npos;
  return std::u32string_view(line).find(needle, from);
}

static std::size_t first_non_blank(const std::u32string& line) {
  std::size_t i = 0;
  while (i < line.size() && (line[i] == U' ' || line[i] == U'\t')) ++i;
  return i;
}

static void inline_spans(const std::u32string& line, int base, std::vector<MarkdownSpan>& out) {
  const std::size_t n = line.size();
  std::size_t i = 0;
  while (i < n) {
    char32_t c = line[i];
    if ((c == U'*' || c == U'_') && i + 1 < n && line[i + 1] == c) {
      const std::u32string close(2, c);
      auto end = find_from(line, i + 2, close);
      if (end != std::u32string::npos && end > i + 2) {
        out.push_back({"bold", base + static_cast<int>(i + 2), base + static_cast<int>(end)});
        i = end + 2;
        continue;
      }
    } else if ((c == U'*' || c == U'_') && i + 1 < n) {
      auto end = find_from(line, i + 1, std::u32string(1, c));
      if (end != std::u32string::npos && end > i + 1) {
        out.push_back({"italic", base + static_cast<int>(i + 1), base + static_cast<int>(end)});
        i = end + 1;
        continue;
      }
    } else if (c == U'`') {
      auto end = find_from(line, i + 1, U"`");
      if (end != std::u32string::npos) {
        out.push_back({"code", base + static_cast<int>(i + 1), base + static_cast<int>(end)});
        i = end + 1;
        continue;
      }
    } else if (c == U'[') {
      auto mid = find_from(line, i, U"](");
      if (mid != std::u32string::npos) {
        auto close = find_from(line, mid + 2, U")");
        if (close != std::u32string::npos) {
          out.push_back({"link", base + static_cast<int>(i), base + static_cast<int>(close + 1)});
          i = close + 1;
          continue;
        }
      }
    }
    ++i;
  }
}

std::vector<MarkdownSpan> highlight_markdown(std::string_view text) {
  std::vector<MarkdownSpan> out;
  const std::u32string doc = decode_utf8(text);
  bool in_code = false;
  std::size_t pos = 0;
  while (true) {
    std::size_t nl = doc.find(U'\n', pos);
    std::size_t stop = nl == std::u32string::npos ? doc.size() : nl;
    std::u32string line = doc.substr(pos, stop - pos);
    const int base = static_cast<int>(pos);
    const int line_end = static_cast<int>(stop);
    std::size_t lead = first_non_blank(line);

    if (line.compare(lead, 3, U"```") == 0) {
      in_code = !in_code;
      out.push_back({"code_block", base, line_end});
    } else if (in_code) {
      out.push_back({"code_block", base, line_end});
    } else {
      if (!line.empty() && line[0] == U'#') {
        std::size_t level = 0;
        while (level < line.size() && line[level] == U'#') ++level;
        if (level <= 6 && level < line.size() && line[level] == U' ')
          out.push_back({"h" + std::to_string(level), base, line_end});
      } else if (lead < line.size() && line[lead] == U'>') {
        out.push_back({"blockquote", base, line_end});
      } else if (lead < line.size() && (line[lead] == U'-' || line[lead] == U'*' || line[lead] == U'+')) {
        out.push_back({"list", base + static_cast<int>(lead), base + static_cast<int>(lead) + 1});
      }
      inline_spans(line, base, out);
    }

    if (nl == std::u32string::npos) break;
    pos = nl + 1;
  }
  return out;
}

} // namespace penenv::app
