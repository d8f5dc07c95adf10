#include "higlint/scan/text_scanner.h"

#include <algorithm>

namespace higlint::scan {

std::size_t line_number_at(std::string_view text, std::size_t offset) noexcept {
  const std::size_t limit = std::min(offset, text.size());
  const auto newlines = std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(limit),
                                   '\n');
  return static_cast<std::size_t>(newlines) + 1;
}

std::string_view line_containing(std::string_view text, std::size_t offset,
                                 std::size_t* line_begin) noexcept {
  const std::size_t pos = std::min(offset, text.size());

  // rfind with pos - 1 excludes a newline sitting exactly at offset
  std::size_t begin = 0;
  if (pos > 0) {
    const std::size_t prev_newline = text.rfind('\n', pos - 1);
    if (prev_newline != std::string_view::npos) {
      begin = prev_newline + 1;
    }
  }

  std::size_t end = text.find('\n', pos);
  if (end == std::string_view::npos) {
    end = text.size();
  }

  if (line_begin != nullptr) {
    *line_begin = begin;
  }
  return text.substr(begin, end - begin);
}

bool comment_precedes(std::string_view line, std::size_t column) noexcept {
  const std::size_t marker = line.find(kLineCommentMarker);
  return marker != std::string_view::npos && marker < column;
}

bool is_in_line_comment(std::string_view text, std::size_t offset) noexcept {
  std::size_t begin = 0;
  const std::string_view line = line_containing(text, offset, &begin);
  return comment_precedes(line, std::min(offset, text.size()) - begin);
}

BlockSpan find_balanced_block(std::string_view text, std::size_t start, char open,
                              char close) noexcept {
  BlockSpan span;
  span.begin = std::min(start, text.size());
  span.end = text.size();

  int depth = 0;
  bool entered = false;
  for (std::size_t i = span.begin; i < text.size(); ++i) {
    if (text[i] == open) {
      ++depth;
      entered = true;
    } else if (text[i] == close) {
      --depth;
      if (entered && depth == 0) {
        span.end = i;
        span.closed = true;
        break;
      }
    }
  }

  return span;
}

LineIndex::LineIndex(std::string_view text) : text_size_(text.size()) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      line_starts_.push_back(i + 1);
    }
  }
}

std::size_t LineIndex::line_at(std::size_t offset) const noexcept {
  const std::size_t pos = std::min(offset, text_size_);
  // A line start equal to pos means the newline lies strictly before pos
  const auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), pos);
  return static_cast<std::size_t>(it - line_starts_.begin());
}

std::size_t LineIndex::line_start(std::size_t line) const noexcept {
  if (line == 0) {
    return 0;
  }
  if (line > line_starts_.size()) {
    return text_size_;
  }
  return line_starts_[line - 1];
}

}  // namespace higlint::scan
