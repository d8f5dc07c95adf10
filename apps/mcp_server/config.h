#pragma once

#include "../shared/arg_parser.h"

#include <cstddef>
#include <string>
#include <vector>

namespace higlint::mcp {

constexpr std::size_t kDefaultMaxCodeBytes = 1024 * 1024;

// McpServerConfig holds all parsed startup flags for the MCP server.
// Every field has an explicit default.
struct McpServerConfig {
  bool quiet{false};                                 // NOLINT(readability-identifier-naming)
  std::size_t max_code_bytes{kDefaultMaxCodeBytes};  // NOLINT(readability-identifier-naming)
  bool show_help{false};                             // NOLINT(readability-identifier-naming)
};

std::vector<apps::Option<McpServerConfig>> build_option_registry();

// parse_args fills config and returns every flag problem found (empty on success).
std::vector<std::string> parse_args(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    McpServerConfig& config);

}  // namespace higlint::mcp
