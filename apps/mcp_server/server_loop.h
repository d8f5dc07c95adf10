#pragma once

#include "server_context.h"
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace higlint::mcp {

// handle_line processes one JSON-RPC message and returns the response line to write,
// or nullopt when nothing must be written (blank lines and notifications).
std::optional<std::string> handle_line(const std::string& line, ServerContext& ctx);

// run_server_loop reads one request per line from in and writes one response per line to
// out until end of input. Requests are handled strictly in arrival order.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace higlint::mcp
