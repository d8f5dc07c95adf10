#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace higlint::analysis {

// Two-valued, fixed per rule. There is no third severity.
enum class Severity {
  kWarning,
  kError,
};

[[nodiscard]] std::string_view severity_to_string(Severity severity) noexcept;

// Violation is one reported occurrence of a rule's trigger condition.
// line is 1-based; it is empty for file-scoped checks that have no single occurrence.
struct Violation {
  Severity severity{Severity::kWarning};
  std::string rule;
  std::string message;
  std::optional<std::size_t> line;
};

}  // namespace higlint::analysis
