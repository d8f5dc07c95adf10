#include "server_loop.h"

#include "mcp_protocol.h"
#include "method_handlers.h"
#include <exception>
#include <string>

namespace higlint::mcp {

std::optional<std::string> handle_line(const std::string& line, ServerContext& ctx) {
  if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) {
    return std::nullopt;
  }

  auto request_opt = parse_request(line);
  if (!request_opt.has_value()) {
    return make_error_response(nullptr, kParseError, "Invalid JSON");
  }

  const auto& request = request_opt.value();
  if (!ctx.config.quiet) {
    ctx.log << "Received: " << request.method << "\n";
  }

  // Method registry
  static const auto method_registry = build_method_registry();

  auto it = method_registry.find(request.method);
  if (it == method_registry.end()) {
    if (request.is_notification()) {
      return std::nullopt;
    }
    return make_error_response(request.id, kMethodNotFound, "Unknown method: " + request.method);
  }

  try {
    auto result = it->second(request, ctx);
    if (request.is_notification()) {
      return std::nullopt;
    }
    return make_response(request.id, result);
  } catch (const std::exception& e) {
    ctx.log << "Error handling " << request.method << ": " << e.what() << "\n";
    return make_error_response(request.id, kInternalError, e.what());
  }
}

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  // Main loop: read JSON-RPC requests from in, write responses to out
  std::string line;
  while (std::getline(in, line)) {
    auto response = handle_line(line, ctx);
    if (response.has_value()) {
      out << response.value() << "\n" << std::flush;
    }
  }

  if (!ctx.config.quiet) {
    ctx.log << "MCP Server shutting down\n";
  }
}

}  // namespace higlint::mcp
