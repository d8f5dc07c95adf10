#include "higlint/scan/token_scan.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace higlint::scan;

TEST_CASE("match_integer_argument reads digits up to the closing paren", "[scan][token_scan]") {
  const std::string text = "width:  44) trailing";

  const auto argument = match_integer_argument(text, 6);
  REQUIRE(argument.has_value());
  CHECK(argument->digits == "44");
  CHECK(argument->end == text.find(')') + 1);
}

TEST_CASE("match_integer_argument rejects anything but a lone integer", "[scan][token_scan]") {
  CHECK_FALSE(match_integer_argument(" 30, height: 30)", 0).has_value());
  CHECK_FALSE(match_integer_argument(" size)", 0).has_value());
  CHECK_FALSE(match_integer_argument(" )", 0).has_value());
  CHECK_FALSE(match_integer_argument(" 12", 0).has_value());
  CHECK_FALSE(match_integer_argument("", 0).has_value());
}

TEST_CASE("match_decimal_literal accepts digits and dots", "[scan][token_scan]") {
  const std::string text = " 0.5, green";

  const auto end = match_decimal_literal(text, 0);
  REQUIRE(end.has_value());
  CHECK(*end == text.find(','));

  CHECK(match_decimal_literal(".", 0).has_value());
  CHECK_FALSE(match_decimal_literal(" value", 0).has_value());
  CHECK_FALSE(match_decimal_literal("   ", 0).has_value());
}

TEST_CASE("identifier bytes include multi-byte UTF-8 sequences", "[scan][token_scan]") {
  const std::string name = "\xC3\x9C" "berViewModel {";

  CHECK(skip_identifier(name, 0) == name.find(' '));
  CHECK(is_identifier_char('_'));
  CHECK_FALSE(is_identifier_char('{'));
  CHECK_FALSE(is_identifier_char(':'));
}

TEST_CASE("skip_spaces and starts_with_at stay within the text", "[scan][token_scan]") {
  const std::string text = "  \t\n";

  CHECK(skip_spaces(text, 0) == text.size());
  CHECK(skip_spaces(text, text.size() + 3) == text.size() + 3);
  CHECK(starts_with_at("Button(", 0, "Button("));
  CHECK_FALSE(starts_with_at("Butt", 0, "Button("));
  CHECK_FALSE(starts_with_at("Button(", 9, "B"));
}
