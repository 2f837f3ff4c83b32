#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/CommandTemplate.hpp"

namespace penenv::app {

using penenv::model::CommandTemplate;

// Parse a "commands:" document. Every item needs all four fields; on any
// error out is left untouched and err says why.
bool parse_commands(std::string_view yaml, std::vector<CommandTemplate>& out, std::string& err);
std::string serialize_commands(const std::vector<CommandTemplate>& commands);

// Templates compiled into the binary from data/commands.yaml.
std::vector<CommandTemplate> builtin_commands();

// Built-ins followed by the user's custom templates. A source that fails to
// parse is logged and skipped.
std::vector<CommandTemplate> load_command_templates(const std::filesystem::path& custom_path);

// Custom template file operations. Index errors report "Invalid command index".
std::vector<CommandTemplate> load_custom_commands(const std::filesystem::path& path);
bool save_custom_commands_list(const std::filesystem::path& path,
                               const std::vector<CommandTemplate>& commands, std::string& err);
bool save_custom_command(const std::filesystem::path& path, const CommandTemplate& cmd, std::string& err);
bool delete_custom_command(const std::filesystem::path& path, std::size_t index, std::string& err);
bool update_custom_command(const std::filesystem::path& path, std::size_t index,
                           const CommandTemplate& cmd, std::string& err);

// Template from the add/edit form. Name and command are required (after
// trimming); empty description and category become "Custom command" and
// "Custom".
std::optional<CommandTemplate> make_custom_command(std::string_view name, std::string_view command,
                                                   std::string_view description, std::string_view category,
                                                   std::string& err);

} // namespace penenv::app
