#pragma once

#include "higlint/analysis/violation.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace higlint::scan {
class SourceText;
}  // namespace higlint::scan

namespace higlint::analysis {

// SwiftRule is the abstract base class for all lint rules.
// A rule is a pure function of the source text: it holds no mutable state, never reads
// another rule's output, and returns its violations in match order.
class SwiftRule {
 public:
  virtual ~SwiftRule() = default;

  // Rule metadata
  [[nodiscard]] virtual std::string_view rule_id() const noexcept = 0;
  [[nodiscard]] virtual Severity severity() const noexcept = 0;
  [[nodiscard]] virtual std::string_view description() const noexcept = 0;

  // Scan the whole source and return every occurrence of the trigger condition.
  // Must not throw for any text, including empty or unbalanced input.
  [[nodiscard]] virtual std::vector<Violation> Check(const scan::SourceText& source) const = 0;

 protected:
  SwiftRule() = default;
  SwiftRule(const SwiftRule&) = default;
  SwiftRule& operator=(const SwiftRule&) = default;
  SwiftRule(SwiftRule&&) = default;
  SwiftRule& operator=(SwiftRule&&) = default;

  [[nodiscard]] Violation make_violation(std::string message,
                                         std::optional<std::size_t> line) const {
    return Violation{severity(), std::string(rule_id()), std::move(message), line};
  }
};

}  // namespace higlint::analysis
