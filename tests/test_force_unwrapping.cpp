#include "higlint/analysis/rules/force_unwrapping.h"
#include "higlint/scan/source_text.h"

#include <catch2/catch_test_macros.hpp>

using namespace higlint::analysis;
using higlint::scan::SourceText;

namespace {

std::size_t count_unwraps(const char* text) {
  const ForceUnwrapping rule;
  return rule.Check(SourceText(text)).size();
}

}  // namespace

TEST_CASE("force_unwrapping flags a postfix bang", "[rules][force_unwrapping]") {
  const ForceUnwrapping rule;
  const auto violations = rule.Check(SourceText("x!"));

  REQUIRE(violations.size() == 1);
  CHECK(violations[0].rule == "force_unwrapping");
  CHECK(violations[0].severity == Severity::kError);
  CHECK(violations[0].message ==
        "Force unwrapping (!) can cause crashes. Use optional binding (if let, guard let) or nil "
        "coalescing (??) instead.");
  CHECK(violations[0].line == 1);
}

TEST_CASE("force_unwrapping skips the inequality operator", "[rules][force_unwrapping]") {
  CHECK(count_unwraps("x != y") == 0);
  CHECK(count_unwraps("if a !== b { }") == 0);
  // Only an '=' directly after the bang excludes it
  CHECK(count_unwraps("x ! = y") == 1);
}

TEST_CASE("force_unwrapping skips try!", "[rules][force_unwrapping]") {
  CHECK(count_unwraps("let data = try! Data(contentsOf: url)") == 0);
  CHECK(count_unwraps("let data = try? Data(contentsOf: url)!") == 1);
}

TEST_CASE("force_unwrapping ignores bangs inside a same-line comment",
          "[rules][force_unwrapping]") {
  CHECK(count_unwraps("// foo!") == 0);
  CHECK(count_unwraps("foo! // comment") == 1);
  CHECK(count_unwraps("let a = 1 // really!\nlet b = c!") == 1);
}

TEST_CASE("force_unwrapping treats // in a string literal as a comment start",
          "[rules][force_unwrapping]") {
  // Known heuristic limitation, kept for behavioral parity
  CHECK(count_unwraps("let u = URL(string: \"https://example.com\")!") == 0);
}

TEST_CASE("force_unwrapping reports every bang with its own line", "[rules][force_unwrapping]") {
  const ForceUnwrapping rule;
  const auto violations = rule.Check(SourceText("let a = b!\n\nif !flag { c!.run() }"));

  // Prefix negation is not distinguished from unwrapping
  REQUIRE(violations.size() == 3);
  CHECK(violations[0].line == 1);
  CHECK(violations[1].line == 3);
  CHECK(violations[2].line == 3);
}

TEST_CASE("force_unwrapping finds nothing in bang-free code", "[rules][force_unwrapping]") {
  CHECK(count_unwraps("") == 0);
  CHECK(count_unwraps("guard let value = optional else { return }") == 0);
}
