#include "higlint/analysis/analyzer.h"
#include "higlint/analysis/rules/force_unwrapping.h"
#include "higlint/analysis/rules/hardcoded_color.h"
#include "higlint/analysis/rules/hardcoded_font_size.h"
#include "higlint/analysis/rules/hardcoded_frame_size.h"
#include "higlint/analysis/rules/missing_accessibility_label.h"
#include "higlint/analysis/rules/missing_viewmodel_state.h"
#include "higlint/analysis/rules/touch_target_too_small.h"
#include "higlint/scan/source_text.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace higlint::analysis;
using higlint::scan::SourceText;

namespace {

constexpr std::size_t kRunLength = 200000;

std::string run(char ch) { return std::string(kRunLength, ch); }

}  // namespace

TEST_CASE("long whitespace and digit runs in frame and font calls", "[rules][large_input]") {
  const HardcodedFrameSize frame_rule;
  const auto digits = frame_rule.Check(SourceText(".frame(width: " + run('1') + ")"));
  REQUIRE(digits.size() == 1);
  CHECK(digits[0].line == 1);

  CHECK(frame_rule.Check(SourceText(".frame(height:" + run(' ') + "20)")).size() == 1);
  CHECK(frame_rule.Check(SourceText(".frame(width:" + run(' '))).empty());

  const HardcodedFontSize font_rule;
  CHECK(font_rule.Check(SourceText(".font(.system(size:" + run('\n') + "18))")).size() == 1);
  CHECK(font_rule.Check(SourceText(".font(.system(size: " + run('9') + "))")).size() == 1);
}

TEST_CASE("long runs inside color initializers", "[rules][large_input]") {
  const HardcodedColor rule;

  CHECK(rule.Check(SourceText("Color(red:" + run(' ') + "1")).size() == 1);
  CHECK(rule.Check(SourceText("Color(hue: " + run('.'))).size() == 1);
  CHECK(rule.Check(SourceText("Color(.sRGB," + run('\t') + "red: 1)")).size() == 1);
  CHECK(rule.Check(SourceText("UIColor(red: " + run('5'))).size() == 2);
  CHECK(rule.Check(SourceText("Color(red:" + run(' '))).empty());
}

TEST_CASE("long identifiers and gaps in ViewModel declarations", "[rules][large_input]") {
  const MissingViewModelState rule;

  CHECK(rule.Check(SourceText("class " + run('a') + "ViewModel {}")).size() == 1);
  CHECK(rule.Check(SourceText("class" + run(' ') + "AViewModel {}")).size() == 1);
  CHECK(rule.Check(SourceText("class " + run('a') + " {}")).empty());
  CHECK(rule.Check(SourceText("class AViewModel {\n enum" + run(' ') + "State" + run(' ') + "{}"))
            .empty());
}

TEST_CASE("long runs around buttons and bangs", "[rules][large_input]") {
  const TouchTargetTooSmall touch_rule;
  const auto touch = touch_rule.Check(
      SourceText("Button(\"Go\")" + run(' ') + "{ go() }\n.frame(width:" + run(' ') + "30)"));
  REQUIRE(touch.size() == 1);
  CHECK(touch[0].line == 1);

  const MissingAccessibilityLabel label_rule;
  CHECK(label_rule.Check(SourceText("Button(action: go) {" + run(' ') + "Image(\"x\") }")).size() ==
        1);
  CHECK(label_rule.Check(SourceText("Button(" + run('{'))).empty());

  const ForceUnwrapping bang_rule;
  CHECK(bang_rule.Check(SourceText("let a = b" + run(' ') + "!")).size() == 1);
  CHECK(bang_rule.Check(SourceText(std::string(20000, '!'))).size() == 20000);
  CHECK(bang_rule.Check(SourceText("//" + std::string(20000, '!'))).empty());
}

TEST_CASE("analyze completes on a large file of repeated constructs", "[analyzer][large_input]") {
  std::string source;
  for (int i = 0; i < 5000; ++i) {
    source += "Text(\"row\").frame(width: 10).font(.system(size: 12)).foregroundColor(Color(red: "
              "0.1, green: 0.2, blue: 0.3))\n";
  }
  source += "class " + run('x') + "ViewModel {}\n";

  const auto result = analyze(source);
  CHECK(result.status == AnalysisStatus::kSuccess);
  CHECK(result.summary.total == 15001);
  CHECK(result.summary.warnings == 15001);
}
