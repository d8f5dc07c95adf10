#pragma once

#include "higlint/scan/text_scanner.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace higlint::scan {

/// Immutable source buffer shared read-only by every rule of one analysis.
class SourceText final {
 public:
  explicit SourceText(std::string text);

  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] std::size_t size() const noexcept { return text_.size(); }
  [[nodiscard]] bool empty() const noexcept { return text_.empty(); }

  [[nodiscard]] std::size_t line_at(std::size_t offset) const noexcept {
    return line_index_.line_at(offset);
  }

  /// Same answer as is_in_line_comment(text(), offset), from the per-line marker table.
  [[nodiscard]] bool in_line_comment(std::size_t offset) const noexcept;

  [[nodiscard]] BlockSpan block_from(std::size_t start) const noexcept {
    return find_balanced_block(text_, start);
  }

 private:
  std::string text_;
  LineIndex line_index_;
  // Offset of the first comment marker on each line, npos when the line has none
  std::vector<std::size_t> comment_starts_;
};

}  // namespace higlint::scan
