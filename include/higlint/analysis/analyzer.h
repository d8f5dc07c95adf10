#pragma once

#include "higlint/analysis/analysis_result.h"
#include "higlint/analysis/rule_set.h"

#include <string_view>

namespace higlint::analysis {

// Analyzer is a class (not struct) per C++ Core Guidelines C.2:
// It owns the rule set and keeps it immutable after construction.
class Analyzer {
 public:
  explicit Analyzer(RuleSet rule_set);

  // analyze() is const: no state carries over between calls, so identical input always
  // yields identical results. Every rule runs once, in rule-set order, and their violations
  // are concatenated before the summary is derived.
  [[nodiscard]] AnalysisResult analyze(std::string_view source_text) const;

  [[nodiscard]] const RuleSet& rule_set() const noexcept { return rule_set_; }

 private:
  RuleSet rule_set_;
};

// Analyzes with the default rule set.
[[nodiscard]] AnalysisResult analyze(std::string_view source_text);

}  // namespace higlint::analysis
