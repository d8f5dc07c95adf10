#include "higlint/analysis/rules/hardcoded_color.h"

#include "higlint/scan/source_text.h"
#include "higlint/scan/token_scan.h"

#include <array>
#include <optional>

namespace higlint::analysis {

namespace {

constexpr const char* kMessage =
    "Hardcoded RGB/HSB color. Use semantic colors (e.g., .primary, .systemBackground) or Asset "
    "Catalog colors.";

// ColorSpelling is one constructor prefix plus what must follow it: a numeric literal,
// or (for the sRGB form) the "red:" label.
struct ColorSpelling {
  std::string_view prefix;
  bool numeric_argument;
};

constexpr std::array<ColorSpelling, 4> kSpellings{{
    {"Color(red:", true},
    {"Color(.sRGB,", false},
    {"Color(hue:", true},
    {"UIColor(red:", true},
}};

constexpr std::string_view kRedLabel = "red:";

// One past the end of the match at pos, if the spelling matches there.
std::optional<std::size_t> match_spelling(std::string_view text, std::size_t pos,
                                          const ColorSpelling& spelling) noexcept {
  const std::size_t after = pos + spelling.prefix.size();
  if (spelling.numeric_argument) {
    return scan::match_decimal_literal(text, after);
  }
  const std::size_t label = scan::skip_spaces(text, after);
  if (!scan::starts_with_at(text, label, kRedLabel)) {
    return std::nullopt;
  }
  return label + kRedLabel.size();
}

}  // namespace

std::vector<Violation> HardcodedColor::Check(const scan::SourceText& source) const {
  std::vector<Violation> violations;
  const std::string_view text = source.text();

  // Spellings are reported in table order, not interleaved by position
  for (const auto& spelling : kSpellings) {
    std::size_t pos = text.find(spelling.prefix);
    while (pos != std::string_view::npos) {
      const auto end = match_spelling(text, pos, spelling);
      if (!end.has_value()) {
        pos = text.find(spelling.prefix, pos + 1);
        continue;
      }
      violations.push_back(make_violation(kMessage, source.line_at(pos)));
      pos = text.find(spelling.prefix, *end);
    }
  }

  return violations;
}

}  // namespace higlint::analysis
