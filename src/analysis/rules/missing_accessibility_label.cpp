#include "higlint/analysis/rules/missing_accessibility_label.h"

#include "higlint/scan/source_text.h"

#include <algorithm>
#include <string_view>

namespace higlint::analysis {

namespace {

constexpr std::string_view kButtonOpen = "Button(";
constexpr std::string_view kImageOpen = "Image(";
constexpr std::string_view kAccessibilityLabel = ".accessibilityLabel";

constexpr const char* kMessage =
    "Image-only button should have .accessibilityLabel() for VoiceOver support.";

}  // namespace

std::vector<Violation> MissingAccessibilityLabel::Check(const scan::SourceText& source) const {
  std::vector<Violation> violations;
  const std::string_view text = source.text();

  for (std::size_t start = text.find(kButtonOpen); start != std::string_view::npos;
       start = text.find(kButtonOpen, start + kButtonOpen.size())) {
    const scan::BlockSpan block = source.block_from(start);

    // Snippet covers the block plus trailing modifiers after its closing brace
    const std::size_t snippet_end =
        block.closed ? std::min(block.end + kLookaheadWindow, text.size()) : text.size();
    const std::string_view snippet = text.substr(start, snippet_end - start);

    if (snippet.find(kImageOpen) != std::string_view::npos &&
        snippet.find(kAccessibilityLabel) == std::string_view::npos) {
      violations.push_back(make_violation(kMessage, source.line_at(start)));
    }
  }

  return violations;
}

}  // namespace higlint::analysis
