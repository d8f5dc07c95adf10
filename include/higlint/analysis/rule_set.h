#pragma once

#include "higlint/analysis/swift_rule.h"

#include <memory>
#include <string>
#include <vector>

namespace higlint::analysis {

// RuleSet holds an ordered collection of polymorphic lint rules.
// Rule evaluation order is deterministic (preserves vector order) and decides the order
// of violations in every result.
struct RuleSet {
  std::string rule_set_id;
  std::string version;
  std::vector<std::unique_ptr<const SwiftRule>> rules;
};

// The fixed SwiftUI Human Interface Guidelines rule set, in evaluation order:
// hardcoded_frame_size, hardcoded_color, hardcoded_font_size, force_unwrapping,
// touch_target_too_small, missing_viewmodel_state, missing_accessibility_label.
RuleSet make_default_rule_set();

}  // namespace higlint::analysis
