#pragma once

#include <cctype>
#include <charconv>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace penenv::util {

// Reader/writer for the small YAML subset the config files use: top-level
// scalars, one level of nested block mappings, and block sequences of flat
// mappings. Section "" addresses top-level scalars.
class YamlReader {
public:
  struct Scalar {
    std::string text;
    bool null{false};
    bool is_string{false}; // quoted in the source or set as a string
  };
  using Item = std::vector<std::pair<std::string, Scalar>>;

  bool load(const std::string& path) {
    nodes_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    parse(ss.str());
    return true;
  }

  // Lines that do not fit the subset are skipped.
  void parse(std::string_view text) {
    nodes_.clear();
    Node* current = nullptr;
    bool in_item = false;
    while (!text.empty()) {
      auto nl = text.find('\n');
      std::string_view line = text.substr(0, nl);
      text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
      if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

      std::size_t indent = 0;
      while (indent < line.size() && line[indent] == ' ') ++indent;
      auto content = trim(line);
      if (content.empty() || content[0] == '#' || content == "---") continue;

      bool dash = content[0] == '-' && (content.size() == 1 || content[1] == ' ');
      if (indent == 0 && !dash) {
        in_item = false;
        std::string key; std::string_view rest;
        if (!split_key(content, key, rest)) { current = nullptr; continue; }
        current = &ensure_node(key);
        *current = Node{};
        rest = trim(rest);
        if (rest.empty() || rest[0] == '#') {
          current->kind = Kind::Pending;
        } else if (rest == "[]") {
          current->kind = Kind::Sequence;
        } else if (rest == "{}") {
          current->kind = Kind::Mapping;
        } else {
          current->kind = Kind::Scalar;
          current->scalar = parse_scalar(rest);
        }
        continue;
      }

      if (!current) continue;
      if (dash) {
        if (current->kind != Kind::Pending && current->kind != Kind::Sequence) continue;
        current->kind = Kind::Sequence;
        current->items.emplace_back();
        in_item = true;
        auto rest = trim(content.substr(1));
        if (rest.empty()) continue;
        std::string key; std::string_view value;
        if (split_key(rest, key, value)) set_entry(current->items.back(), key, parse_value(value));
        continue;
      }

      std::string key; std::string_view value;
      if (!split_key(content, key, value)) continue;
      if (current->kind == Kind::Sequence) {
        if (in_item && !current->items.empty()) set_entry(current->items.back(), key, parse_value(value));
        continue;
      }
      if (current->kind == Kind::Pending) current->kind = Kind::Mapping;
      if (current->kind == Kind::Mapping) set_entry(current->entries, key, parse_value(value));
    }
    for (auto& [name, node] : nodes_) {
      if (node.kind == Kind::Pending) {
        node.kind = Kind::Scalar;
        node.scalar = Scalar{"", true, false};
      }
    }
  }

  bool save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) return false;
    out << dump();
    out.flush();
    return out.good();
  }

  [[nodiscard]] std::string dump() const {
    std::string out;
    for (const auto& [name, node] : nodes_) {
      out += name;
      out += ':';
      switch (node.kind) {
        case Kind::Scalar:
          out += ' ';
          out += format_scalar(node.scalar);
          out += '\n';
          break;
        case Kind::Mapping:
          if (node.entries.empty()) { out += " {}\n"; break; }
          out += '\n';
          for (const auto& [k, v] : node.entries) {
            out += "  " + k + ": " + format_scalar(v) + '\n';
          }
          break;
        case Kind::Sequence:
          if (node.items.empty()) { out += " []\n"; break; }
          out += '\n';
          for (const auto& item : node.items) {
            bool first = true;
            if (item.empty()) { out += "- {}\n"; continue; }
            for (const auto& [k, v] : item) {
              out += first ? "- " : "  ";
              out += k + ": " + format_scalar(v) + '\n';
              first = false;
            }
          }
          break;
        case Kind::Pending:
          out += " null\n";
          break;
      }
    }
    return out;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* s = find_scalar(section, key);
    return (s && !s->null) ? s->text : def;
  }

  [[nodiscard]] std::int64_t get_int(std::string_view section, std::string_view key,
                                     std::int64_t def = 0) const {
    const auto* s = find_scalar(section, key);
    if (!s || s->null || s->is_string) return def;
    return to_int(s->text, def);
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* s = find_scalar(section, key);
    if (!s || s->null || s->is_string) return def;
    return to_double(s->text, def);
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_scalar(section, key);
    if (!s || s->null || s->is_string) return def;
    return to_bool(s->text, def);
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find_scalar(section, key) != nullptr;
  }

  [[nodiscard]] bool is_null(std::string_view section, std::string_view key) const {
    const auto* s = find_scalar(section, key);
    return s && s->null;
  }

  [[nodiscard]] bool has_sequence(std::string_view key) const {
    const auto* n = find_node(key);
    return n && n->kind == Kind::Sequence;
  }

  // Empty when the key is absent or not a sequence.
  [[nodiscard]] const std::vector<Item>& sequence(std::string_view key) const {
    static const std::vector<Item> empty;
    const auto* n = find_node(key);
    return (n && n->kind == Kind::Sequence) ? n->items : empty;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    put(section, key, Scalar{value, false, true});
  }
  void set(const std::string& section, const std::string& key, const char* value) {
    set(section, key, std::string(value));
  }
  void set(const std::string& section, const std::string& key, std::int64_t value) {
    put(section, key, Scalar{std::to_string(value), false, false});
  }
  void set(const std::string& section, const std::string& key, int value) {
    set(section, key, static_cast<std::int64_t>(value));
  }
  void set(const std::string& section, const std::string& key, double value) {
    put(section, key, Scalar{format_double(value), false, false});
  }
  void set(const std::string& section, const std::string& key, bool value) {
    put(section, key, Scalar{value ? "true" : "false", false, false});
  }
  void set_null(const std::string& section, const std::string& key) {
    put(section, key, Scalar{"", true, false});
  }

  void set_sequence(const std::string& key, std::vector<Item> items) {
    auto& n = ensure_node(key);
    n = Node{};
    n.kind = Kind::Sequence;
    n.items = std::move(items);
  }

  static const Scalar* item_find(const Item& item, std::string_view key) {
    for (const auto& [k, v] : item)
      if (k == key) return &v;
    return nullptr;
  }

  static std::string item_string(const Item& item, std::string_view key, const std::string& def = "") {
    const auto* s = item_find(item, key);
    return (s && !s->null) ? s->text : def;
  }

  static Scalar string_scalar(std::string text) { return Scalar{std::move(text), false, true}; }

  // Shortest round-trip form, always with a '.' regardless of locale.
  static std::string format_double(double v) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    std::string s(buf, res.ptr);
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
    return s;
  }

private:
  enum class Kind { Pending, Scalar, Mapping, Sequence };

  struct Node {
    Kind kind{Kind::Pending};
    Scalar scalar;
    Item entries;
    std::vector<Item> items;
  };

  std::vector<std::pair<std::string, Node>> nodes_;

  Node& ensure_node(const std::string& name) {
    for (auto& [n, node] : nodes_)
      if (n == name) return node;
    nodes_.emplace_back(name, Node{});
    return nodes_.back().second;
  }

  [[nodiscard]] const Node* find_node(std::string_view name) const {
    for (const auto& [n, node] : nodes_)
      if (n == name) return &node;
    return nullptr;
  }

  [[nodiscard]] const Scalar* find_scalar(std::string_view section, std::string_view key) const {
    if (section.empty()) {
      const auto* n = find_node(key);
      return (n && n->kind == Kind::Scalar) ? &n->scalar : nullptr;
    }
    const auto* n = find_node(section);
    if (!n || n->kind != Kind::Mapping) return nullptr;
    return item_find(n->entries, key);
  }

  void put(const std::string& section, const std::string& key, Scalar value) {
    if (section.empty()) {
      auto& n = ensure_node(key);
      n = Node{};
      n.kind = Kind::Scalar;
      n.scalar = std::move(value);
      return;
    }
    auto& n = ensure_node(section);
    if (n.kind != Kind::Mapping) { n = Node{}; n.kind = Kind::Mapping; }
    set_entry(n.entries, key, std::move(value));
  }

  static void set_entry(Item& entries, const std::string& key, Scalar value) {
    for (auto& [k, v] : entries) {
      if (k == key) { v = std::move(value); return; }
    }
    entries.emplace_back(key, std::move(value));
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // "key: value" or "key:" -> key and the remainder after the colon
  static bool split_key(std::string_view sv, std::string& key, std::string_view& rest) {
    std::size_t pos = 0;
    if (!sv.empty() && (sv[0] == '"' || sv[0] == '\'')) {
      std::size_t used = 0;
      Scalar k = parse_quoted(sv, used);
      if (used == 0 || used >= sv.size() || sv[used] != ':') return false;
      key = k.text;
      rest = sv.substr(used + 1);
      return true;
    }
    while (true) {
      pos = sv.find(':', pos);
      if (pos == std::string_view::npos) return false;
      if (pos + 1 == sv.size() || sv[pos + 1] == ' ' || sv[pos + 1] == '\t') break;
      ++pos;
    }
    key = std::string(trim(sv.substr(0, pos)));
    if (key.empty()) return false;
    rest = sv.substr(pos + 1);
    return true;
  }

  static Scalar parse_value(std::string_view rest) {
    rest = trim(rest);
    if (rest.empty() || rest[0] == '#') return Scalar{"", true, false};
    return parse_scalar(rest);
  }

  static Scalar parse_scalar(std::string_view sv) {
    if (sv[0] == '"' || sv[0] == '\'') {
      std::size_t used = 0;
      Scalar s = parse_quoted(sv, used);
      if (used > 0) return s;
    }
    // Plain scalar: a comment starts at " #"
    auto hash = sv.find(" #");
    if (hash != std::string_view::npos) sv = sv.substr(0, hash);
    sv = trim(sv);
    if (sv.empty() || sv == "~" || sv == "null" || sv == "Null" || sv == "NULL")
      return Scalar{"", true, false};
    return Scalar{std::string(sv), false, false};
  }

  // used is set to the number of characters consumed, 0 when unterminated
  static Scalar parse_quoted(std::string_view sv, std::size_t& used) {
    used = 0;
    const char q = sv[0];
    std::string out;
    for (std::size_t i = 1; i < sv.size(); ++i) {
      char c = sv[i];
      if (q == '\'') {
        if (c == '\'') {
          if (i + 1 < sv.size() && sv[i + 1] == '\'') { out.push_back('\''); ++i; continue; }
          used = i + 1;
          return Scalar{out, false, true};
        }
        out.push_back(c);
        continue;
      }
      if (c == '\\' && i + 1 < sv.size()) {
        char e = sv[++i];
        switch (e) {
          case 'n': out.push_back('\n'); break;
          case 't': out.push_back('\t'); break;
          case 'r': out.push_back('\r'); break;
          case '0': out.push_back('\0'); break;
          default: out.push_back(e); break;
        }
        continue;
      }
      if (c == '"') {
        used = i + 1;
        return Scalar{out, false, true};
      }
      out.push_back(c);
    }
    return Scalar{};
  }

  static std::int64_t to_int(const std::string& s, std::int64_t def) {
    if (s.empty()) return def;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return def;
    return static_cast<std::int64_t>(v);
  }

  static double to_double(const std::string& s, double def) {
    if (s.empty()) return def;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (*first == '+') ++first;
    double v = 0.0;
    auto res = std::from_chars(first, last, v);
    if (res.ec != std::errc{} || res.ptr != last) return def;
    return v;
  }

  static bool to_bool(const std::string& s, bool def) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    return def;
  }

  static bool looks_typed(const std::string& s) {
    if (s == "~" || s == "null" || s == "Null" || s == "NULL") return true;
    if (s == "true" || s == "True" || s == "TRUE" || s == "false" || s == "False" || s == "FALSE") return true;
    if (s == "yes" || s == "no" || s == "on" || s == "off" || s == "y" || s == "n" || s == "Y" || s == "N") return true;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (*first == '+') ++first;
    double v = 0.0;
    auto res = std::from_chars(first, last, v);
    return (res.ec == std::errc{} || res.ec == std::errc::result_out_of_range) && res.ptr == last;
  }

  static bool needs_quoting(const std::string& s) {
    if (s.empty()) return true;
    if (std::isspace(static_cast<unsigned char>(s.front())) || std::isspace(static_cast<unsigned char>(s.back())))
      return true;
    if (std::string_view("-?:,[]{}#&*!|>'\"%@`").find(s.front()) != std::string_view::npos) return true;
    if (s.find(": ") != std::string::npos || s.find(" #") != std::string::npos) return true;
    if (s.back() == ':') return true;
    for (char c : s) {
      if (c == '\n' || c == '\t' || c == '\r' || c == '"' || c == '\\') return true;
    }
    return looks_typed(s);
  }

  static std::string format_scalar(const Scalar& s) {
    if (s.null) return "null";
    if (!s.is_string || !needs_quoting(s.text)) return s.text;
    std::string out = "\"";
    for (char c : s.text) {
      switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default: out.push_back(c); break;
      }
    }
    out.push_back('"');
    return out;
  }
};

} // namespace penenv::util
