#include "higlint/analysis/analyzer.h"
#include "higlint/protocol/analysis_request.h"
#include "higlint/protocol/request_handler.h"
#include "higlint/protocol/response_json.h"

#include "cli_config.h"
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

using namespace higlint;

namespace {

// Reads the whole request document; the request may span several lines.
bool read_request(const cli::CliConfig& config, std::string& out) {
  if (!config.input_path.has_value()) {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }

  std::ifstream file(config.input_path.value(), std::ios::binary);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto options = cli::build_cli_options();
  const auto parsed = apps::parse_options(argc, argv, options);

  if (parsed.config.show_help) {
    apps::print_usage(std::cout, "higlint_cli", options);
    return protocol::kExitOk;
  }

  // Validate config before emitting any output so no partial payload appears on error.
  if (!parsed.errors.empty()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    return protocol::kExitFailure;
  }
  const std::string config_error = cli::validate_cli_config(parsed.config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return protocol::kExitFailure;
  }

  std::string input;
  if (!read_request(parsed.config, input)) {
    std::cerr << "Failed to open input file: " << parsed.config.input_path.value() << "\n";
    return protocol::kExitFailure;
  }

  try {
    const analysis::Analyzer analyzer{analysis::make_default_rule_set()};
    const auto response = protocol::respond_to_request(analyzer, input);
    std::cout << protocol::render_payload(response.payload, parsed.config.indent) << "\n";
    return response.exit_code;
  } catch (const std::exception& e) {
    const auto payload =
        protocol::error_to_json(std::string(protocol::kAnalysisFailedPrefix) + e.what());
    std::cout << protocol::render_payload(payload, parsed.config.indent) << "\n";
    return protocol::kExitFailure;
  }
}
