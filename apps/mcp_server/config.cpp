#include "config.h"

#include <exception>
#include <string>
#include <utility>

namespace higlint::mcp {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_quiet(McpServerConfig& config, const std::string& /*value*/) {
  config.quiet = true;
  return true;
}

bool handle_max_code_bytes(McpServerConfig& config, const std::string& value) {
  if (value.empty() || value[0] == '-') {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const unsigned long long bytes = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    config.max_code_bytes = static_cast<std::size_t>(bytes);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool handle_help(McpServerConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<McpServerConfig>> build_option_registry() {
  return {
      {"--quiet", false, "Suppress informational stderr output", handle_quiet},
      {"--max-code-bytes", true, "Reject code arguments larger than this (default 1048576)",
       handle_max_code_bytes},
      {"--help", false, "Show this help and exit", handle_help},
  };
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

std::vector<std::string> parse_args(int argc, char* argv[], McpServerConfig& config) {
  auto parsed = apps::parse_options(argc, argv, build_option_registry());
  config = parsed.config;
  return std::move(parsed.errors);
}

}  // namespace higlint::mcp
