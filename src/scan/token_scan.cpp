#include "higlint/scan/token_scan.h"

namespace higlint::scan {

bool is_space(char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

bool is_digit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

bool is_identifier_char(char ch) noexcept {
  const auto byte = static_cast<unsigned char>(ch);
  return (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') || is_digit(ch) ||
         byte == '_' || byte >= 0x80;
}

bool starts_with_at(std::string_view text, std::size_t pos, std::string_view prefix) noexcept {
  return pos <= text.size() && text.substr(pos, prefix.size()) == prefix;
}

std::size_t skip_spaces(std::string_view text, std::size_t pos) noexcept {
  while (pos < text.size() && is_space(text[pos])) {
    ++pos;
  }
  return pos;
}

std::size_t skip_identifier(std::string_view text, std::size_t pos) noexcept {
  while (pos < text.size() && is_identifier_char(text[pos])) {
    ++pos;
  }
  return pos;
}

std::optional<IntegerArgument> match_integer_argument(std::string_view text,
                                                      std::size_t pos) noexcept {
  const std::size_t digits_begin = skip_spaces(text, pos);
  std::size_t cursor = digits_begin;
  while (cursor < text.size() && is_digit(text[cursor])) {
    ++cursor;
  }
  if (cursor == digits_begin || cursor >= text.size() || text[cursor] != ')') {
    return std::nullopt;
  }
  return IntegerArgument{text.substr(digits_begin, cursor - digits_begin), cursor + 1};
}

std::optional<std::size_t> match_decimal_literal(std::string_view text,
                                                 std::size_t pos) noexcept {
  const std::size_t literal_begin = skip_spaces(text, pos);
  std::size_t cursor = literal_begin;
  while (cursor < text.size() && (is_digit(text[cursor]) || text[cursor] == '.')) {
    ++cursor;
  }
  if (cursor == literal_begin) {
    return std::nullopt;
  }
  return cursor;
}

}  // namespace higlint::scan
