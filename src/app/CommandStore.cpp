#include "app/CommandStore.hpp"
#include "app/BuiltinCommands.hpp"
#include "util/Log.hpp"
#include "util/YamlReader.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace penenv::app {

namespace fs = std::filesystem;
using penenv::util::YamlReader;

static const char* kFields[] = {"name", "command", "description", "category"};

bool parse_commands(std::string_view yaml, std::vector<CommandTemplate>& out, std::string& err) {
  YamlReader y;
  y.parse(yaml);
  if (!y.has_sequence("commands")) {
    err = "missing field `commands`";
    return false;
  }
  std::vector<CommandTemplate> parsed;
  std::size_t idx = 0;
  for (const auto& item : y.sequence("commands")) {
    for (const char* f : kFields) {
      const auto* s = YamlReader::item_find(item, f);
      if (!s || s->null) {
        err = "commands[" + std::to_string(idx) + "]: missing field `" + f + "`";
        return false;
      }
    }
    CommandTemplate c;
    c.name = YamlReader::item_string(item, "name");
    c.command = YamlReader::item_string(item, "command");
    c.description = YamlReader::item_string(item, "description");
    c.category = YamlReader::item_string(item, "category");
    parsed.push_back(std::move(c));
    ++idx;
  }
  out = std::move(parsed);
  return true;
}

std::string serialize_commands(const std::vector<CommandTemplate>& commands) {
  std::vector<YamlReader::Item> items;
  items.reserve(commands.size());
  for (const auto& c : commands) {
    items.push_back({
      {"name", YamlReader::string_scalar(c.name)},
      {"command", YamlReader::string_scalar(c.command)},
      {"description", YamlReader::string_scalar(c.description)},
      {"category", YamlReader::string_scalar(c.category)},
    });
  }
  YamlReader y;
  y.set_sequence("commands", std::move(items));
  return y.dump();
}

std::vector<CommandTemplate> builtin_commands() {
  std::vector<CommandTemplate> out;
  std::string err;
  if (!parse_commands(kBuiltinCommandsYaml, out, err))
    PENENV_LOG_WARN("failed to parse built-in commands: %s. Command drawer will be empty.", err.c_str());
  return out;
}

static bool read_file(const fs::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

std::vector<CommandTemplate> load_command_templates(const fs::path& custom_path) {
  auto commands = builtin_commands();
  std::string text;
  if (!custom_path.empty() && read_file(custom_path, text)) {
    std::vector<CommandTemplate> custom;
    std::string err;
    if (parse_commands(text, custom, err))
      commands.insert(commands.end(), custom.begin(), custom.end());
    else
      PENENV_LOG_WARN("failed to parse %s: %s", custom_path.c_str(), err.c_str());
  }
  return commands;
}

std::vector<CommandTemplate> load_custom_commands(const fs::path& path) {
  std::vector<CommandTemplate> out;
  std::string text, err;
  if (!read_file(path, text)) return out;
  if (!parse_commands(text, out, err)) PENENV_LOG_DEBUG("custom commands unreadable: %s", err.c_str());
  return out;
}

bool save_custom_commands_list(const fs::path& path, const std::vector<CommandTemplate>& commands,
                               std::string& err) {
  auto yaml = serialize_commands(commands);
  errno = 0;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    err = std::string("Failed to write file: ") + (errno ? std::strerror(errno) : "cannot open " + path.string());
    return false;
  }
  out << yaml;
  out.flush();
  if (!out.good()) {
    err = "Failed to write file: write error";
    return false;
  }
  return true;
}

bool save_custom_command(const fs::path& path, const CommandTemplate& cmd, std::string& err) {
  auto commands = load_custom_commands(path);
  commands.push_back(cmd);
  return save_custom_commands_list(path, commands, err);
}

bool delete_custom_command(const fs::path& path, std::size_t index, std::string& err) {
  auto commands = load_custom_commands(path);
  if (index >= commands.size()) {
    err = "Invalid command index";
    return false;
  }
  commands.erase(commands.begin() + static_cast<std::ptrdiff_t>(index));
  return save_custom_commands_list(path, commands, err);
}

bool update_custom_command(const fs::path& path, std::size_t index, const CommandTemplate& cmd,
                           std::string& err) {
  auto commands = load_custom_commands(path);
  if (index >= commands.size()) {
    err = "Invalid command index";
    return false;
  }
  commands[index] = cmd;
  return save_custom_commands_list(path, commands, err);
}

static std::string trimmed(std::string_view s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

std::optional<CommandTemplate> make_custom_command(std::string_view name, std::string_view command,
                                                   std::string_view description, std::string_view category,
                                                   std::string& err) {
  CommandTemplate t{trimmed(name), trimmed(command), trimmed(description), trimmed(category)};
  if (t.name.empty() || t.command.empty()) {
    err = "Name and command are required";
    return std::nullopt;
  }
  if (t.description.empty()) t.description = "Custom command";
  if (t.category.empty()) t.category = "Custom";
  return t;
}

} // namespace penenv::app
