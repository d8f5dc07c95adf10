#include "higlint/scan/source_text.h"

#include <algorithm>
#include <utility>

namespace higlint::scan {

SourceText::SourceText(std::string text) : text_(std::move(text)), line_index_(text_) {
  const std::string_view view = text_;
  const std::size_t lines = line_index_.line_count();
  comment_starts_.reserve(lines);

  for (std::size_t line = 1; line <= lines; ++line) {
    const std::size_t begin = line_index_.line_start(line);
    const std::size_t end = line_index_.line_start(line + 1);
    const std::size_t marker = view.substr(begin, end - begin).find(kLineCommentMarker);
    comment_starts_.push_back(marker == std::string_view::npos ? std::string_view::npos
                                                               : begin + marker);
  }
}

bool SourceText::in_line_comment(std::size_t offset) const noexcept {
  const std::size_t pos = std::min(offset, text_.size());
  const std::size_t marker = comment_starts_[line_index_.line_at(pos) - 1];
  return marker != std::string_view::npos && marker < pos;
}

}  // namespace higlint::scan
