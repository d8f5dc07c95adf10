#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace higlint::scan {

/// Swift single-line comment marker.
constexpr std::string_view kLineCommentMarker = "//";

/// Returns the 1-based line containing offset: newlines strictly before offset, plus one.
/// Offsets past the end of text are clamped to text.size().
[[nodiscard]] std::size_t line_number_at(std::string_view text, std::size_t offset) noexcept;

/// Returns the physical line (without its terminating newline) that contains offset.
/// line_begin receives the offset of the first character of that line.
[[nodiscard]] std::string_view line_containing(std::string_view text, std::size_t offset,
                                               std::size_t* line_begin = nullptr) noexcept;

/// True when the first comment marker on line starts before column.
/// Heuristic: a marker inside a string literal still counts as a comment start.
[[nodiscard]] bool comment_precedes(std::string_view line, std::size_t column) noexcept;

/// True when offset falls after a line comment marker on its own physical line.
[[nodiscard]] bool is_in_line_comment(std::string_view text, std::size_t offset) noexcept;

// BlockSpan is the extent of one brace-delimited block found by find_balanced_block.
// end is the offset of the closing delimiter when closed, otherwise text.size().
struct BlockSpan {
  std::size_t begin{0};
  std::size_t end{0};
  bool closed{false};
};

/// Scans forward from start with a depth counter. Every open delimiter increments the
/// depth and marks the block entered; every close delimiter decrements it. The span ends
/// at the first close delimiter that brings an entered block back to depth zero.
/// Unbalanced input degrades to a span reaching end of text; the scan never reads past it.
[[nodiscard]] BlockSpan find_balanced_block(std::string_view text, std::size_t start,
                                            char open = '{', char close = '}') noexcept;

// LineIndex precomputes line start offsets once so repeated line lookups are O(log n).
// line_starts_ always begins with zero and is sorted ascending.
class LineIndex {
 public:
  explicit LineIndex(std::string_view text);

  /// 1-based line number of offset; agrees with line_number_at for every offset.
  [[nodiscard]] std::size_t line_at(std::size_t offset) const noexcept;

  [[nodiscard]] std::size_t line_count() const noexcept { return line_starts_.size(); }

  /// Offset of the first character of a 1-based line.
  [[nodiscard]] std::size_t line_start(std::size_t line) const noexcept;

 private:
  std::vector<std::size_t> line_starts_{0};
  std::size_t text_size_{0};
};

}  // namespace higlint::scan
