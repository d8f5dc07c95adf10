#include "higlint/protocol/response_json.h"

#include <string>

namespace higlint::protocol {

nlohmann::ordered_json violation_to_json(const analysis::Violation& violation) {
  nlohmann::ordered_json j;
  j["severity"] = std::string(analysis::severity_to_string(violation.severity));
  j["rule"] = violation.rule;
  j["message"] = violation.message;
  if (violation.line.has_value()) {
    j["line"] = violation.line.value();
  }
  return j;
}

nlohmann::ordered_json result_to_json(const analysis::AnalysisResult& result) {
  nlohmann::ordered_json j;
  j["status"] = std::string(analysis::status_to_string(result.status));

  nlohmann::ordered_json violations_json = nlohmann::ordered_json::array();
  for (const auto& violation : result.violations) {
    violations_json.push_back(violation_to_json(violation));
  }
  j["violations"] = violations_json;

  nlohmann::ordered_json summary_json;
  summary_json["total"] = result.summary.total;
  summary_json["errors"] = result.summary.errors;
  summary_json["warnings"] = result.summary.warnings;
  j["summary"] = summary_json;

  return j;
}

nlohmann::ordered_json error_to_json(const std::string& message) {
  nlohmann::ordered_json j;
  j["status"] = std::string(analysis::status_to_string(analysis::AnalysisStatus::kError));
  j["message"] = message;
  return j;
}

std::string render_payload(const nlohmann::ordered_json& payload, int indent) {
  // Invalid UTF-8 in echoed source is replaced rather than thrown on
  return payload.dump(indent, ' ', true, nlohmann::ordered_json::error_handler_t::replace);
}

}  // namespace higlint::protocol
