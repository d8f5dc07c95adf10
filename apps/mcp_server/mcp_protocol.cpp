#include "mcp_protocol.h"

#include <cstdint>

namespace higlint::mcp {

namespace {

// Echoed ids are restricted to the JSON-RPC id types.
nlohmann::ordered_json id_to_json(const nlohmann::json& id) {
  if (id.is_string()) {
    return id.get<std::string>();
  }
  if (id.is_number_unsigned()) {
    return id.get<std::uint64_t>();
  }
  if (id.is_number_integer()) {
    return id.get<std::int64_t>();
  }
  return nullptr;
}

std::string dump_line(const nlohmann::ordered_json& response) {
  return response.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

}  // namespace

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  try {
    auto json = nlohmann::json::parse(json_str);
    if (!json.is_object()) {
      return std::nullopt;
    }

    JsonRpcRequest request;
    request.jsonrpc = json.value("jsonrpc", "2.0");

    if (json.contains("id") && (json["id"].is_string() || json["id"].is_number_integer())) {
      request.id = json["id"];
    }

    request.method = json.value("method", "");
    request.params = json.value("params", nlohmann::json::object());

    return request;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

std::string make_response(const nlohmann::json& id, const nlohmann::ordered_json& result) {
  nlohmann::ordered_json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_to_json(id);
  response["result"] = result;
  return dump_line(response);
}

std::string make_error_response(const nlohmann::json& id, int code, const std::string& message,
                                const nlohmann::ordered_json& data) {
  nlohmann::ordered_json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_to_json(id);
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return dump_line(response);
}

}  // namespace higlint::mcp
