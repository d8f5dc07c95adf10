#include "higlint/analysis/rules/missing_viewmodel_state.h"
#include "higlint/scan/source_text.h"

#include <catch2/catch_test_macros.hpp>

using namespace higlint::analysis;
using higlint::scan::SourceText;

TEST_CASE("missing_viewmodel_state flags a ViewModel without a State enum",
          "[rules][missing_viewmodel_state]") {
  const SourceText source(
      "import SwiftUI\n"
      "\n"
      "final class ProfileViewModel: ObservableObject {\n"
      "    @Published var name = \"\"\n"
      "}\n");

  const MissingViewModelState rule;
  const auto violations = rule.Check(source);

  REQUIRE(violations.size() == 1);
  CHECK(violations[0].rule == "missing_viewmodel_state");
  CHECK(violations[0].severity == Severity::kWarning);
  CHECK(violations[0].message ==
        "ViewModel should expose a State enum (e.g., idle, loading, content, error) for state "
        "management.");
  CHECK_FALSE(violations[0].line.has_value());
}

TEST_CASE("missing_viewmodel_state accepts a nested State enum",
          "[rules][missing_viewmodel_state]") {
  const SourceText source(
      "class ProfileViewModel {\n"
      "    enum State { case idle }\n"
      "}\n");

  const MissingViewModelState rule;
  CHECK(rule.Check(source).empty());
}

TEST_CASE("missing_viewmodel_state ignores files without a ViewModel class",
          "[rules][missing_viewmodel_state]") {
  const MissingViewModelState rule;

  CHECK(rule.Check(SourceText("struct ProfileView: View { }")).empty());
  CHECK(rule.Check(SourceText("")).empty());
  // A struct is not a class declaration
  CHECK(rule.Check(SourceText("struct ProfileViewModel { }")).empty());
  // The suffix needs a non-empty prefix
  CHECK(rule.Check(SourceText("class ViewModel { }")).empty());
}

TEST_CASE("missing_viewmodel_state reports at most once per file",
          "[rules][missing_viewmodel_state]") {
  const SourceText source(
      "class ListViewModel { }\n"
      "class DetailViewModel { }\n");

  const MissingViewModelState rule;
  CHECK(rule.Check(source).size() == 1);
}

TEST_CASE("missing_viewmodel_state requires the enum body brace",
          "[rules][missing_viewmodel_state]") {
  const MissingViewModelState rule;

  CHECK(rule.Check(SourceText("class AViewModel {\n  enum State\n  {\n  case idle\n  }\n}"))
            .empty());
  CHECK(rule.Check(SourceText("class AViewModel {\n  enum State: Equatable { case idle }\n}"))
            .size() == 1);
}

TEST_CASE("missing_viewmodel_state accepts non-ASCII class names",
          "[rules][missing_viewmodel_state]") {
  const MissingViewModelState rule;

  const auto violations = rule.Check(SourceText("class \xC3\x9C" "berViewModel {}"));
  REQUIRE(violations.size() == 1);
  CHECK_FALSE(violations[0].line.has_value());

  CHECK(rule.Check(SourceText("final class \xE5\x90\x8D\xE5\x89\x8DViewModel {\n"
                              "    enum State { case idle }\n"
                              "}\n"))
            .empty());
  // The prefix must be part of the same identifier
  CHECK(rule.Check(SourceText("class \xC3\x9C ViewModel {}")).empty());
}
