#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace higlint::mcp::handlers {

// Returns the analysis payload: {status: success, violations, summary} or {status: error,
// message}. Request problems are reported in the payload, never as JSON-RPC errors.
nlohmann::ordered_json handle_analyze_swift_code(const nlohmann::json& params, ServerContext& ctx);

}  // namespace higlint::mcp::handlers
