#include "higlint/analysis/analysis_result.h"

namespace higlint::analysis {

std::string_view severity_to_string(Severity severity) noexcept {
  switch (severity) {
    case Severity::kError:
      return "error";
    case Severity::kWarning:
      return "warning";
  }
  return "warning";
}

std::string_view status_to_string(AnalysisStatus status) noexcept {
  switch (status) {
    case AnalysisStatus::kSuccess:
      return "success";
    case AnalysisStatus::kError:
      return "error";
  }
  return "error";
}

Summary summarize(const std::vector<Violation>& violations) noexcept {
  Summary summary;
  summary.total = violations.size();
  for (const auto& violation : violations) {
    if (violation.severity == Severity::kError) {
      ++summary.errors;
    } else {
      ++summary.warnings;
    }
  }
  return summary;
}

}  // namespace higlint::analysis
