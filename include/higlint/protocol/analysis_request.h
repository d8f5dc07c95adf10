#pragma once

#include "higlint/core/result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace higlint::protocol {

constexpr const char* kNoCodeMessage = "No Swift code provided for analysis.";
constexpr const char* kInvalidJsonPrefix = "Invalid JSON input: ";
constexpr const char* kAnalysisFailedPrefix = "Analysis failed: ";

struct AnalysisRequest {
  std::string code;
};

enum class RequestErrorKind {
  kMissingCode,  // reported as a payload; not a process failure
  kMalformed,    // the envelope could not be decoded; process exits non-zero
  kTooLarge,     // code exceeds the configured size limit
};

// RequestError carries the complete message placed in the error payload.
struct RequestError {
  RequestErrorKind kind{RequestErrorKind::kMalformed};
  std::string message;
};

using RequestResult = core::Result<AnalysisRequest, RequestError>;

/// Decode a raw request document: a JSON object with a "code" string.
/// Falsy code values (absent, null, false, 0, "", [], {}) are kMissingCode; any other
/// non-string code, unparsable JSON and non-object documents are kMalformed.
[[nodiscard]] RequestResult parse_analysis_request(const std::string& input);

/// Decode an already-parsed request object, e.g. MCP tool arguments.
/// max_code_bytes, when set, rejects longer code with kTooLarge.
[[nodiscard]] RequestResult request_from_json(
    const nlohmann::json& request, std::optional<std::size_t> max_code_bytes = std::nullopt);

}  // namespace higlint::protocol
