#include "higlint/scan/source_text.h"
#include "higlint/scan/text_scanner.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace higlint::scan;

TEST_CASE("LineIndex agrees with line_number_at for every offset", "[scan][line_index]") {
  const std::string text = "\nimport SwiftUI\n\nstruct A {\n  var b: Int\n}\n";
  const LineIndex index(text);

  for (std::size_t offset = 0; offset <= text.size() + 2; ++offset) {
    CHECK(index.line_at(offset) == line_number_at(text, offset));
  }
}

TEST_CASE("LineIndex over empty text has one line", "[scan][line_index]") {
  const LineIndex index("");
  CHECK(index.line_at(0) == 1);
  CHECK(index.line_at(5) == 1);
}

TEST_CASE("SourceText comment lookup agrees with is_in_line_comment", "[scan][source_text]") {
  const std::string text =
      "let a = b! // note!\n"
      "// whole line!\n"
      "\n"
      "let url = \"http://x\"!\n"
      "let c = d!/";
  const SourceText source(text);

  for (std::size_t offset = 0; offset <= text.size() + 2; ++offset) {
    CHECK(source.in_line_comment(offset) == is_in_line_comment(text, offset));
  }
}

TEST_CASE("SourceText exposes scanner primitives over its own buffer", "[scan][source_text]") {
  const SourceText source("let a = b!\n// c!\nButton(\"x\") { }");

  CHECK(source.size() == 32);
  CHECK_FALSE(source.empty());
  CHECK(source.line_at(source.text().find("Button")) == 3);
  CHECK_FALSE(source.in_line_comment(source.text().find('!')));
  CHECK(source.in_line_comment(source.text().rfind('!')));

  const auto block = source.block_from(source.text().find("Button"));
  CHECK(block.closed);
  CHECK(block.end == source.size() - 1);
}
