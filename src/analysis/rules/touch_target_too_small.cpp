#include "higlint/analysis/rules/touch_target_too_small.h"

#include "higlint/scan/source_text.h"
#include "higlint/scan/token_scan.h"

#include <array>
#include <string>

namespace higlint::analysis {

namespace {

constexpr std::string_view kButtonOpen = "Button(";
constexpr std::string_view kFrameOpen = ".frame(";
constexpr std::array<std::string_view, 2> kDimensionLabels = {"width:", "height:"};

// Offset of the '{' that opens the button body: the first ')' on the "Button(" line that
// is followed by optional whitespace and '{'.
std::optional<std::size_t> find_body_open(std::string_view text, std::size_t args) noexcept {
  for (std::size_t i = args; i < text.size() && text[i] != '\n'; ++i) {
    if (text[i] != ')') {
      continue;
    }
    const std::size_t next = scan::skip_spaces(text, i + 1);
    if (next < text.size() && text[next] == '{') {
      return next;
    }
  }
  return std::nullopt;
}

// Matches "width:|height:" followed by an integer argument at pos.
std::optional<scan::IntegerArgument> match_dimension(std::string_view text,
                                                     std::size_t pos) noexcept {
  for (const auto label : kDimensionLabels) {
    if (scan::starts_with_at(text, pos, label)) {
      return scan::match_integer_argument(text, pos + label.size());
    }
  }
  return std::nullopt;
}

// First ".frame(" starting in [from, limit) whose line carries a literal dimension.
// The earliest frame wins, then the earliest label on its line.
std::optional<TouchTargetMatch> find_frame_dimension(std::string_view text, std::size_t from,
                                                     std::size_t limit) noexcept {
  for (std::size_t frame = text.find(kFrameOpen, from);
       frame != std::string_view::npos && frame < limit;
       frame = text.find(kFrameOpen, frame + 1)) {
    // The dimension label must sit on the same line as ".frame("
    for (std::size_t pos = frame + kFrameOpen.size(); pos < text.size() && text[pos] != '\n';
         ++pos) {
      const auto dimension = match_dimension(text, pos);
      if (dimension.has_value()) {
        return TouchTargetMatch{frame, dimension->end, dimension->digits};
      }
    }
  }
  return std::nullopt;
}

// Leading zeros dropped; anything with three or more significant digits is >= 100.
bool below_minimum(std::string_view digits, unsigned minimum, unsigned* value) noexcept {
  const std::size_t first = digits.find_first_not_of('0');
  const std::string_view significant =
      first == std::string_view::npos ? std::string_view{} : digits.substr(first);
  if (significant.size() > 2) {
    return false;
  }
  unsigned parsed = 0;
  for (const char ch : significant) {
    parsed = parsed * 10 + static_cast<unsigned>(ch - '0');
  }
  *value = parsed;
  return parsed < minimum;
}

}  // namespace

std::optional<TouchTargetMatch> match_touch_target(std::string_view text,
                                                   std::size_t begin) noexcept {
  if (!scan::starts_with_at(text, begin, kButtonOpen)) {
    return std::nullopt;
  }

  const auto body_open = find_body_open(text, begin + kButtonOpen.size());
  if (!body_open.has_value()) {
    return std::nullopt;
  }

  // The body ends at the first '}' with no nesting awareness
  const std::size_t body_close = text.find('}', *body_open + 1);
  if (body_close == std::string_view::npos) {
    return std::nullopt;
  }

  // A frame modifier on the button itself wins; one inside the label counts otherwise
  auto found = find_frame_dimension(text, body_close + 1, text.size());
  if (!found.has_value()) {
    found = find_frame_dimension(text, *body_open + 1, body_close);
  }
  if (!found.has_value()) {
    return std::nullopt;
  }

  found->begin = begin;
  return found;
}

std::vector<Violation> TouchTargetTooSmall::Check(const scan::SourceText& source) const {
  std::vector<Violation> violations;
  const std::string_view text = source.text();

  std::size_t pos = text.find(kButtonOpen);
  while (pos != std::string_view::npos) {
    const auto match = match_touch_target(text, pos);
    if (!match.has_value()) {
      pos = text.find(kButtonOpen, pos + 1);
      continue;
    }

    unsigned size = 0;
    if (below_minimum(match->size_digits, kMinimumTouchTarget, &size)) {
      violations.push_back(make_violation(
          "Touch target size is " + std::to_string(size) +
              "pt, which is below the minimum 44pt. Use .frame(minWidth: 44, minHeight: 44) or "
              "add .contentShape(Rectangle()).",
          source.line_at(match->begin)));
    }

    // Matches never overlap: resume after the frame call
    pos = text.find(kButtonOpen, match->end);
  }

  return violations;
}

}  // namespace higlint::analysis
