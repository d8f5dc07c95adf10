#include "higlint/analysis/rules/force_unwrapping.h"

#include "higlint/scan/source_text.h"

#include <string_view>

namespace higlint::analysis {

namespace {

constexpr std::string_view kForceTry = "try";

constexpr const char* kMessage =
    "Force unwrapping (!) can cause crashes. Use optional binding (if let, guard let) or nil "
    "coalescing (??) instead.";

bool is_force_try(std::string_view text, std::size_t bang) noexcept {
  return bang >= kForceTry.size() &&
         text.substr(bang - kForceTry.size(), kForceTry.size()) == kForceTry;
}

// Only an '=' directly after the bang excludes it; "! =" still counts.
bool is_not_equal(std::string_view text, std::size_t bang) noexcept {
  return bang + 1 < text.size() && text[bang + 1] == '=';
}

}  // namespace

std::vector<Violation> ForceUnwrapping::Check(const scan::SourceText& source) const {
  std::vector<Violation> violations;
  const std::string_view text = source.text();

  for (std::size_t pos = text.find('!'); pos != std::string_view::npos;
       pos = text.find('!', pos + 1)) {
    if (is_force_try(text, pos) || is_not_equal(text, pos)) {
      continue;
    }
    if (source.in_line_comment(pos)) {
      continue;
    }
    violations.push_back(make_violation(kMessage, source.line_at(pos)));
  }

  return violations;
}

}  // namespace higlint::analysis
