#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace higlint::scan {

// Byte-level matchers for the fixed call shapes the rules look for. Each one walks the
// text once with an explicit cursor, so cost and stack depth do not grow with run length.

/// Whitespace: space, \t, \n, \r, \v, \f.
[[nodiscard]] bool is_space(char ch) noexcept;

[[nodiscard]] bool is_digit(char ch) noexcept;

/// Identifier byte: ASCII letter, digit or '_', or any byte of a multi-byte UTF-8 sequence.
[[nodiscard]] bool is_identifier_char(char ch) noexcept;

[[nodiscard]] bool starts_with_at(std::string_view text, std::size_t pos,
                                  std::string_view prefix) noexcept;

/// First offset at or after pos that is not whitespace (text.size() if none).
[[nodiscard]] std::size_t skip_spaces(std::string_view text, std::size_t pos) noexcept;

/// First offset at or after pos that is not an identifier byte.
[[nodiscard]] std::size_t skip_identifier(std::string_view text, std::size_t pos) noexcept;

// IntegerArgument is a literal integer closing a call: optional whitespace, digits, ')'.
struct IntegerArgument {
  std::string_view digits;
  std::size_t end{0};  // one past the ')'
};

/// Matches whitespace, one or more digits and ')' starting at pos.
[[nodiscard]] std::optional<IntegerArgument> match_integer_argument(std::string_view text,
                                                                    std::size_t pos) noexcept;

/// Matches whitespace followed by at least one digit or '.' starting at pos.
/// Returns one past the last numeric byte.
[[nodiscard]] std::optional<std::size_t> match_decimal_literal(std::string_view text,
                                                               std::size_t pos) noexcept;

}  // namespace higlint::scan
