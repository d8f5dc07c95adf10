#pragma once

#include "config.h"
#include <string>

namespace higlint::mcp {

// validate_mcp_server_config checks startup preconditions for the MCP server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - max_code_bytes is non-zero (a zero limit would reject every request)
[[nodiscard]] std::string validate_mcp_server_config(const McpServerConfig& config);

}  // namespace higlint::mcp
