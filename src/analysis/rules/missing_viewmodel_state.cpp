#include "higlint/analysis/rules/missing_viewmodel_state.h"

#include "higlint/scan/source_text.h"
#include "higlint/scan/token_scan.h"

namespace higlint::analysis {

namespace {

constexpr std::string_view kClassKeyword = "class";
constexpr std::string_view kViewModelSuffix = "ViewModel";
constexpr std::string_view kEnumKeyword = "enum";
constexpr std::string_view kStateName = "State";

// "class", whitespace, then an identifier with "ViewModel" somewhere after its first byte.
// The keyword may end another word ("subclass") and the name may continue past the suffix.
bool declares_view_model(std::string_view text) noexcept {
  for (std::size_t pos = text.find(kClassKeyword); pos != std::string_view::npos;
       pos = text.find(kClassKeyword, pos + 1)) {
    const std::size_t name_begin = scan::skip_spaces(text, pos + kClassKeyword.size());
    if (name_begin == pos + kClassKeyword.size()) {
      continue;
    }
    const std::size_t name_end = scan::skip_identifier(text, name_begin);
    const std::string_view name = text.substr(name_begin, name_end - name_begin);
    if (name.find(kViewModelSuffix, 1) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

// "enum", whitespace, "State", optional whitespace, '{'.
bool declares_state_enum(std::string_view text) noexcept {
  for (std::size_t pos = text.find(kEnumKeyword); pos != std::string_view::npos;
       pos = text.find(kEnumKeyword, pos + 1)) {
    const std::size_t name = scan::skip_spaces(text, pos + kEnumKeyword.size());
    if (name == pos + kEnumKeyword.size() || !scan::starts_with_at(text, name, kStateName)) {
      continue;
    }
    const std::size_t brace = scan::skip_spaces(text, name + kStateName.size());
    if (brace < text.size() && text[brace] == '{') {
      return true;
    }
  }
  return false;
}

}  // namespace

std::vector<Violation> MissingViewModelState::Check(const scan::SourceText& source) const {
  std::vector<Violation> violations;

  // Not a ViewModel file
  if (!declares_view_model(source.text())) {
    return violations;
  }

  if (!declares_state_enum(source.text())) {
    violations.push_back(make_violation(
        "ViewModel should expose a State enum (e.g., idle, loading, content, error) for state "
        "management.",
        std::nullopt));
  }

  return violations;
}

}  // namespace higlint::analysis
