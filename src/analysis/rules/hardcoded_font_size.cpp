#include "higlint/analysis/rules/hardcoded_font_size.h"

#include "higlint/scan/source_text.h"
#include "higlint/scan/token_scan.h"

#include <string>

namespace higlint::analysis {

namespace {

constexpr std::string_view kSystemFontCall = ".font(.system(size:";

}  // namespace

std::vector<Violation> HardcodedFontSize::Check(const scan::SourceText& source) const {
  std::vector<Violation> violations;
  const std::string_view text = source.text();

  std::size_t pos = text.find(kSystemFontCall);
  while (pos != std::string_view::npos) {
    const auto argument = scan::match_integer_argument(text, pos + kSystemFontCall.size());
    if (!argument.has_value()) {
      pos = text.find(kSystemFontCall, pos + 1);
      continue;
    }
    violations.push_back(make_violation(
        "Hardcoded font size: " + std::string(argument->digits) +
            "pt. Use semantic text styles (e.g., .body, .headline) for Dynamic Type support.",
        source.line_at(pos)));
    pos = text.find(kSystemFontCall, argument->end);
  }

  return violations;
}

}  // namespace higlint::analysis
