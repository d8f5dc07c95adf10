#pragma once

#include "higlint/analysis/swift_rule.h"

#include <cstddef>

namespace higlint::analysis {

// missing_accessibility_label: image button without .accessibilityLabel (WARNING severity)
// For every Button( the balanced brace block starting there is located; the block plus
// kLookaheadWindow trailing characters must not contain Image( without .accessibilityLabel.
class MissingAccessibilityLabel final : public SwiftRule {
 public:
  static constexpr std::size_t kLookaheadWindow = 200;

  MissingAccessibilityLabel() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override {
    return "missing_accessibility_label";
  }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::kWarning; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Image-only buttons need an accessibility label";
  }

  [[nodiscard]] std::vector<Violation> Check(const scan::SourceText& source) const override;
};

}  // namespace higlint::analysis
