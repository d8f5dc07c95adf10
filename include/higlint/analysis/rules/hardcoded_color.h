#pragma once

#include "higlint/analysis/swift_rule.h"

namespace higlint::analysis {

// hardcoded_color: literal RGB/HSB color constructors (WARNING severity)
// Four spellings are scanned independently and their matches concatenated without
// deduplication, so UIColor(red: ...) reports twice (it also contains Color(red: ...)).
class HardcodedColor final : public SwiftRule {
 public:
  HardcodedColor() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "hardcoded_color"; }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::kWarning; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Colors should come from semantic or Asset Catalog colors";
  }

  [[nodiscard]] std::vector<Violation> Check(const scan::SourceText& source) const override;
};

}  // namespace higlint::analysis
