#include "higlint/analysis/rules/hardcoded_frame_size.h"

#include "higlint/scan/source_text.h"
#include "higlint/scan/token_scan.h"

#include <array>
#include <string>
#include <utility>

namespace higlint::analysis {

std::vector<Violation> HardcodedFrameSize::Check(const scan::SourceText& source) const {
  std::vector<Violation> violations;
  const std::string_view text = source.text();

  constexpr std::array<std::pair<std::string_view, const char*>, 2> kCalls{{
      {".frame(width:", "Hardcoded frame width"},
      {".frame(height:", "Hardcoded frame height"},
  }};

  for (const auto& [call, label] : kCalls) {
    std::size_t pos = text.find(call);
    while (pos != std::string_view::npos) {
      const auto argument = scan::match_integer_argument(text, pos + call.size());
      if (!argument.has_value()) {
        pos = text.find(call, pos + 1);
        continue;
      }
      violations.push_back(make_violation(
          std::string(label) + ": " + std::string(argument->digits) +
              "pt. Consider using minWidth/minHeight or semantic tokens.",
          source.line_at(pos)));
      pos = text.find(call, argument->end);
    }
  }

  return violations;
}

}  // namespace higlint::analysis
