#pragma once

#include "higlint/analysis/swift_rule.h"

namespace higlint::analysis {

// hardcoded_frame_size: literal width or height passed to .frame() (WARNING severity)
// Matches .frame(width: N) and .frame(height: N); each call shape is scanned on its own,
// widths first. The message embeds N as written.
class HardcodedFrameSize final : public SwiftRule {
 public:
  HardcodedFrameSize() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override {
    return "hardcoded_frame_size";
  }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::kWarning; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Frame sizes should use minWidth/minHeight or semantic tokens";
  }

  [[nodiscard]] std::vector<Violation> Check(const scan::SourceText& source) const override;
};

}  // namespace higlint::analysis
