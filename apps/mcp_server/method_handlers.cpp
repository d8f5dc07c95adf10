#include "method_handlers.h"

#include "higlint/core/version.h"

#include "handlers/tool_registry.h"
#include <string>

namespace higlint::mcp {

using ojson = nlohmann::ordered_json;

ojson handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return ojson{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", ojson::object()}}},
      {"serverInfo", {{"name", core::kServerName}, {"version", core::kBuildVersion}}},
  };
}

ojson handle_initialized(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return ojson::object();
}

ojson handle_ping(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return ojson::object();
}

ojson handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& ctx) {
  const auto& rule_set = ctx.analyzer.rule_set();

  ojson tools = ojson::array();

  tools.push_back({
      {"name", "analyze_swift_code"},
      {"description",
       "Analyze Swift UI code for Human Interface Guidelines and architecture violations "
       "(rule set " +
           rule_set.rule_set_id + " v" + rule_set.version + ")"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"code",
                 {{"type", "string"}, {"description", "Complete Swift source text to analyze"}}},
            }},
           {"required", ojson::array({"code"})},
       }},
  });

  return ojson{{"tools", tools}};
}

ojson handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  std::string tool_name = req.params.value("name", "");
  nlohmann::json tool_params = req.params.value("arguments", nlohmann::json::object());

  // Tool registry
  static const auto tool_registry = handlers::build_tool_registry();

  auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    ojson error_result;
    error_result["error"] = "Unknown tool: " + tool_name;
    return error_result;
  }

  return it->second(tool_params, ctx);
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"notifications/initialized", handle_initialized},
      {"ping", handle_ping},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

}  // namespace higlint::mcp
