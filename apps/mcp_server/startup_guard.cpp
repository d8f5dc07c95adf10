#include "startup_guard.h"

namespace higlint::mcp {

std::string validate_mcp_server_config(const McpServerConfig& config) {
  if (config.max_code_bytes == 0) {
    return "Error: --max-code-bytes must be greater than zero.\n"
           "       Omit the flag to use the default limit of 1048576 bytes.";
  }

  return "";
}

}  // namespace higlint::mcp
