#include "tool_registry.h"

#include "analyze_swift_code.h"

namespace higlint::mcp::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"analyze_swift_code", handle_analyze_swift_code},
  };
}

}  // namespace higlint::mcp::handlers
