#pragma once

namespace higlint::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.1";

// kServerName is reported in MCP serverInfo and startup banners.
constexpr const char* kServerName = "higlint-mcp";

}  // namespace higlint::core
