#pragma once

#include "higlint/analysis/swift_rule.h"

#include <cstddef>
#include <optional>
#include <string_view>

namespace higlint::analysis {

// TouchTargetMatch is one Button(...) { ... } ... .frame(... width|height: N) span.
struct TouchTargetMatch {
  std::size_t begin{0};
  std::size_t end{0};  // one past the closing ')' of the frame call
  std::string_view size_digits;
};

/// Finds the lazy span starting at the "Button(" located at begin. The body runs from the
/// '{' after the argument list to the first '}'. The first .frame(...width|height: N) after
/// the body is taken, falling back to one inside the body; nullopt when there is neither.
[[nodiscard]] std::optional<TouchTargetMatch> match_touch_target(std::string_view text,
                                                                 std::size_t begin) noexcept;

// touch_target_too_small: Button followed by a literal frame dimension below 44pt
// (ERROR severity). The message embeds the size found.
class TouchTargetTooSmall final : public SwiftRule {
 public:
  static constexpr unsigned kMinimumTouchTarget = 44;

  TouchTargetTooSmall() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override {
    return "touch_target_too_small";
  }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::kError; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Interactive controls need a 44pt minimum touch target";
  }

  [[nodiscard]] std::vector<Violation> Check(const scan::SourceText& source) const override;
};

}  // namespace higlint::analysis
