#include "analyze_swift_code.h"

#include "higlint/protocol/request_handler.h"

#include <cstddef>
#include <utility>

namespace higlint::mcp::handlers {

nlohmann::ordered_json handle_analyze_swift_code(const nlohmann::json& params, ServerContext& ctx) {
  auto response = protocol::respond_to_arguments(ctx.analyzer, params, ctx.config.max_code_bytes);

  if (!ctx.config.quiet && response.payload.contains("summary")) {
    const auto& summary = response.payload["summary"];
    ctx.log << "analyze_swift_code: " << summary["total"].get<std::size_t>() << " violations ("
            << summary["errors"].get<std::size_t>() << " errors, "
            << summary["warnings"].get<std::size_t>() << " warnings)\n";
  }

  return std::move(response.payload);
}

}  // namespace higlint::mcp::handlers
