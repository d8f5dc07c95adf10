#pragma once

#include "higlint/analysis/swift_rule.h"

namespace higlint::analysis {

// force_unwrapping: '!' operator tokens (ERROR severity)
// Every '!' counts except:
// - the one in try! (immediately preceded by "try")
// - one immediately followed by '=' (the != operator)
// - one placed after a // marker on the same line
// Prefix negation is not distinguished from unwrapping.
class ForceUnwrapping final : public SwiftRule {
 public:
  ForceUnwrapping() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "force_unwrapping"; }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::kError; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Avoid force unwrapping; use optional binding or nil coalescing";
  }

  [[nodiscard]] std::vector<Violation> Check(const scan::SourceText& source) const override;
};

}  // namespace higlint::analysis
