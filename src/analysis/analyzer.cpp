#include "higlint/analysis/analyzer.h"

#include "higlint/analysis/rules/force_unwrapping.h"
#include "higlint/analysis/rules/hardcoded_color.h"
#include "higlint/analysis/rules/hardcoded_font_size.h"
#include "higlint/analysis/rules/hardcoded_frame_size.h"
#include "higlint/analysis/rules/missing_accessibility_label.h"
#include "higlint/analysis/rules/missing_viewmodel_state.h"
#include "higlint/analysis/rules/touch_target_too_small.h"
#include "higlint/scan/source_text.h"

#include <iterator>
#include <memory>
#include <string>
#include <utility>

namespace higlint::analysis {

Analyzer::Analyzer(RuleSet rule_set) : rule_set_(std::move(rule_set)) {}

AnalysisResult Analyzer::analyze(std::string_view source_text) const {
  const scan::SourceText source{std::string(source_text)};

  AnalysisResult result{};
  result.status = AnalysisStatus::kSuccess;

  for (const auto& rule : rule_set_.rules) {
    if (!rule) {
      continue;  // Skip null rules
    }

    auto violations = rule->Check(source);
    result.violations.insert(result.violations.end(), std::make_move_iterator(violations.begin()),
                             std::make_move_iterator(violations.end()));
  }

  result.summary = summarize(result.violations);
  return result;
}

AnalysisResult analyze(std::string_view source_text) {
  // Rules are immutable, so one instance serves every call
  static const Analyzer default_analyzer{make_default_rule_set()};
  return default_analyzer.analyze(source_text);
}

RuleSet make_default_rule_set() {
  RuleSet rule_set{};
  rule_set.rule_set_id = "swiftui-hig";
  rule_set.version = "0.1.0";

  // Rules in fixed evaluation order (deterministic)
  rule_set.rules.push_back(std::make_unique<HardcodedFrameSize>());
  rule_set.rules.push_back(std::make_unique<HardcodedColor>());
  rule_set.rules.push_back(std::make_unique<HardcodedFontSize>());
  rule_set.rules.push_back(std::make_unique<ForceUnwrapping>());
  rule_set.rules.push_back(std::make_unique<TouchTargetTooSmall>());
  rule_set.rules.push_back(std::make_unique<MissingViewModelState>());
  rule_set.rules.push_back(std::make_unique<MissingAccessibilityLabel>());

  return rule_set;
}

}  // namespace higlint::analysis
