#include "higlint/protocol/analysis_request.h"

#include <cstdint>
#include <string>
#include <utility>

namespace higlint::protocol {

namespace {

RequestResult malformed(const std::string& detail) {
  return RequestResult::err(
      RequestError{RequestErrorKind::kMalformed, std::string(kInvalidJsonPrefix) + detail});
}

// Mirrors truthiness of a decoded JSON value: empty containers, zero and false are falsy.
bool is_falsy(const nlohmann::json& value) {
  switch (value.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
      return true;
    case nlohmann::json::value_t::boolean:
      return !value.get<bool>();
    case nlohmann::json::value_t::number_integer:
      return value.get<std::int64_t>() == 0;
    case nlohmann::json::value_t::number_unsigned:
      return value.get<std::uint64_t>() == 0;
    case nlohmann::json::value_t::number_float:
      return value.get<double>() == 0.0;
    case nlohmann::json::value_t::string:
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
    case nlohmann::json::value_t::binary:
      return value.empty();
  }
  return false;
}

}  // namespace

RequestResult parse_analysis_request(const std::string& input) {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(input);
  } catch (const nlohmann::json::parse_error& e) {
    return malformed(e.what());
  }
  return request_from_json(request);
}

RequestResult request_from_json(const nlohmann::json& request,
                                std::optional<std::size_t> max_code_bytes) {
  if (!request.is_object()) {
    return malformed("expected a JSON object with a \"code\" field");
  }

  const auto it = request.find("code");
  if (it == request.end() || is_falsy(*it)) {
    return RequestResult::err(RequestError{RequestErrorKind::kMissingCode, kNoCodeMessage});
  }
  if (!it->is_string()) {
    return malformed("field \"code\" must be a string");
  }

  AnalysisRequest parsed;
  parsed.code = it->get<std::string>();

  if (max_code_bytes.has_value() && parsed.code.size() > max_code_bytes.value()) {
    return RequestResult::err(RequestError{
        RequestErrorKind::kTooLarge,
        "Code exceeds maximum size of " + std::to_string(max_code_bytes.value()) + " bytes."});
  }

  return RequestResult::ok(std::move(parsed));
}

}  // namespace higlint::protocol
