#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace higlint::mcp {

// JSON-RPC 2.0 request. id keeps its original JSON form (string or number) so responses
// echo it back unchanged; it is null for notifications.
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};  // NOLINT(readability-identifier-naming)
  nlohmann::json id;           // NOLINT(readability-identifier-naming)
  std::string method;          // NOLINT(readability-identifier-naming)
  nlohmann::json params;       // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool is_notification() const noexcept { return id.is_null(); }
};

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Parse JSON-RPC request from string; nullopt when the line is not a JSON object
std::optional<JsonRpcRequest> parse_request(const std::string& json_str);

// Create JSON-RPC success response
std::string make_response(const nlohmann::json& id, const nlohmann::ordered_json& result);

// Create JSON-RPC error response
std::string make_error_response(const nlohmann::json& id, int code, const std::string& message,
                                const nlohmann::ordered_json& data = nlohmann::ordered_json::object());

}  // namespace higlint::mcp
