#pragma once

#include "higlint/analysis/analyzer.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace higlint::protocol {

// Response pairs the payload with the process exit status the one-shot adapter uses.
// Missing code is still exit 0: the failure is reported in the payload only.
struct Response {
  nlohmann::ordered_json payload;
  int exit_code{0};
};

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

/// Full request/response cycle for a raw request document.
/// Failures are all-or-nothing: an analysis fault yields an error payload, never a partial
/// violation list.
[[nodiscard]] Response respond_to_request(const analysis::Analyzer& analyzer,
                                          const std::string& input);

/// Same cycle for an already-decoded request object (MCP tool arguments).
[[nodiscard]] Response respond_to_arguments(
    const analysis::Analyzer& analyzer, const nlohmann::json& arguments,
    std::optional<std::size_t> max_code_bytes = std::nullopt);

}  // namespace higlint::protocol
