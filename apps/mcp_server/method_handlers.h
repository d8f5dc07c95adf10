#pragma once

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace higlint::mcp {

using MethodHandler =
    std::function<nlohmann::ordered_json(const JsonRpcRequest& req, ServerContext& ctx)>;

nlohmann::ordered_json handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::ordered_json handle_initialized(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::ordered_json handle_ping(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::ordered_json handle_tools_list(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::ordered_json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx);

std::unordered_map<std::string, MethodHandler> build_method_registry();

}  // namespace higlint::mcp
