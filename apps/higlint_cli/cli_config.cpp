#include "cli_config.h"

#include <exception>
#include <string>

namespace higlint::cli {

namespace {

bool handle_indent(CliConfig& config, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const int indent = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    config.indent = indent;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool handle_input(CliConfig& config, const std::string& value) {
  if (value.empty()) {
    return false;
  }
  config.input_path = value;
  return true;
}

bool handle_help(CliConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return true;
}

}  // namespace

std::vector<apps::Option<CliConfig>> build_cli_options() {
  return {
      {"--indent", true, "JSON indentation width (-1 for compact output, default 2)",
       handle_indent},
      {"--input", true, "Read the JSON request from a file instead of stdin", handle_input},
      {"--help", false, "Show this help and exit", handle_help},
  };
}

std::string validate_cli_config(const CliConfig& config) {
  if (config.indent < -1 || config.indent > kMaxIndent) {
    return "Error: --indent must be between -1 and " + std::to_string(kMaxIndent);
  }
  return "";
}

}  // namespace higlint::cli
