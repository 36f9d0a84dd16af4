#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "mcpshim/config.hpp"

namespace mcpshim {

// Fill @p cfg from the command line, falling back to the MCP_* environment
// variables and then to the defaults in config.  Returns an exit code when
// the program should stop right away (--help, bad value).
std::optional<int> parse_options(std::span<char*> args, config& cfg);

// Split a comma separated list, dropping empty items.
std::vector<std::string> split_path_list(std::string_view list);

}  // namespace mcpshim
