#pragma once

#include "higlint/analysis/swift_rule.h"

namespace higlint::analysis {

// hardcoded_font_size: .font(.system(size: N)) instead of a text style (WARNING severity)
class HardcodedFontSize final : public SwiftRule {
 public:
  HardcodedFontSize() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override {
    return "hardcoded_font_size";
  }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::kWarning; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Fonts should use semantic text styles for Dynamic Type";
  }

  [[nodiscard]] std::vector<Violation> Check(const scan::SourceText& source) const override;
};

}  // namespace higlint::analysis
