#pragma once

#include "higlint/analysis/violation.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace higlint::analysis {

enum class AnalysisStatus {
  kSuccess,
  kError,
};

[[nodiscard]] std::string_view status_to_string(AnalysisStatus status) noexcept;

// Summary counts are always derived from the violation list, never stored independently.
// Invariant: total == errors + warnings == violations.size()
struct Summary {
  std::size_t total{0};
  std::size_t errors{0};
  std::size_t warnings{0};
};

// AnalysisResult is computed fresh per request; violations keep detection order
// (rule order, then match order within a rule), not line order.
struct AnalysisResult {
  AnalysisStatus status{AnalysisStatus::kSuccess};
  std::vector<Violation> violations;
  Summary summary;
};

[[nodiscard]] Summary summarize(const std::vector<Violation>& violations) noexcept;

}  // namespace higlint::analysis
