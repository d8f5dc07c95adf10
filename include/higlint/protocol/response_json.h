#pragma once

#include "higlint/analysis/analysis_result.h"

#include <nlohmann/json.hpp>

#include <string>

namespace higlint::protocol {

// Response payloads use ordered_json so keys keep the documented order:
// status, violations, summary; and severity, rule, message, line per violation.

/// Serialize one violation; "line" is omitted for file-scoped violations.
[[nodiscard]] nlohmann::ordered_json violation_to_json(const analysis::Violation& violation);

/// {"status": "success", "violations": [...], "summary": {"total", "errors", "warnings"}}
[[nodiscard]] nlohmann::ordered_json result_to_json(const analysis::AnalysisResult& result);

/// {"status": "error", "message": message}
[[nodiscard]] nlohmann::ordered_json error_to_json(const std::string& message);

/// Render a payload the way the command-line adapter prints it: indented, ASCII-escaped.
/// A negative indent renders compact single-line JSON.
[[nodiscard]] std::string render_payload(const nlohmann::ordered_json& payload, int indent = 2);

}  // namespace higlint::protocol
