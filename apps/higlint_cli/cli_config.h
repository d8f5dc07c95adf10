#pragma once

#include "../shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace higlint::cli {

constexpr int kDefaultIndent = 2;
constexpr int kMaxIndent = 16;

// CliConfig holds the parsed flags of the one-shot adapter.
struct CliConfig {
  int indent{kDefaultIndent};             // NOLINT(readability-identifier-naming)
  std::optional<std::string> input_path;  // NOLINT(readability-identifier-naming)
  bool show_help{false};                  // NOLINT(readability-identifier-naming)
};

std::vector<apps::Option<CliConfig>> build_cli_options();

// validate_cli_config returns "" on success, otherwise the message to print before exiting 1.
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

}  // namespace higlint::cli
