#include "higlint/analysis/analyzer.h"
#include "higlint/core/version.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <iostream>
#include <string>

using namespace higlint;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  mcp::McpServerConfig config;
  const auto arg_errors = mcp::parse_args(argc, argv, config);

  if (config.show_help) {
    apps::print_usage(std::cout, "higlint_mcp_server", mcp::build_option_registry());
    return 0;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  if (!arg_errors.empty()) {
    for (const auto& error : arg_errors) {
      std::cerr << error << "\n";
    }
    return 1;
  }
  const std::string config_error = mcp::validate_mcp_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  const analysis::Analyzer analyzer{analysis::make_default_rule_set()};

  if (!config.quiet) {
    std::cerr << core::kServerName << " MCP Server v" << core::kBuildVersion << "\n";
    std::cerr << "Rule set:    " << analyzer.rule_set().rule_set_id << " v"
              << analyzer.rule_set().version << " (" << analyzer.rule_set().rules.size()
              << " rules)\n";
    std::cerr << "Code limit:  " << config.max_code_bytes << " bytes\n";
    std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  }

  mcp::ServerContext ctx{analyzer, config, std::cerr};
  mcp::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
