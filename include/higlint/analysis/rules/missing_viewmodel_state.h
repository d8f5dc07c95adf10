#pragma once

#include "higlint/analysis/swift_rule.h"

namespace higlint::analysis {

// missing_viewmodel_state: a *ViewModel class without a nested `enum State {` (WARNING)
// File-scoped: at most one violation and it carries no line number.
// Files that declare no ViewModel class produce nothing.
class MissingViewModelState final : public SwiftRule {
 public:
  MissingViewModelState() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override {
    return "missing_viewmodel_state";
  }
  [[nodiscard]] Severity severity() const noexcept override { return Severity::kWarning; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "ViewModels should expose a State enum";
  }

  [[nodiscard]] std::vector<Violation> Check(const scan::SourceText& source) const override;
};

}  // namespace higlint::analysis
