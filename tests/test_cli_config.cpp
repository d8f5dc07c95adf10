#include <catch2/catch_test_macros.hpp>

#include "cli_config.h"

#include <sstream>
#include <string>
#include <vector>

using namespace higlint;

namespace {

apps::ParsedOptions<cli::CliConfig> parse(std::vector<std::string> args) {
  args.insert(args.begin(), "higlint_cli");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return apps::parse_options(static_cast<int>(argv.size()), argv.data(), cli::build_cli_options());
}

}  // namespace

TEST_CASE("no flags yields the default config", "[cli][config]") {
  const auto parsed = parse({});

  CHECK(parsed.errors.empty());
  CHECK(parsed.config.indent == 2);
  CHECK_FALSE(parsed.config.input_path.has_value());
  CHECK_FALSE(parsed.config.show_help);
  CHECK(cli::validate_cli_config(parsed.config).empty());
}

TEST_CASE("--indent and --input are applied", "[cli][config]") {
  const auto parsed = parse({"--indent", "-1", "--input", "request.json"});

  CHECK(parsed.errors.empty());
  CHECK(parsed.config.indent == -1);
  REQUIRE(parsed.config.input_path.has_value());
  CHECK(parsed.config.input_path.value() == "request.json");
  CHECK(cli::validate_cli_config(parsed.config).empty());
}

TEST_CASE("--indent rejects non-numeric values", "[cli][config]") {
  for (const char* value : {"two", "2x", ""}) {
    const auto parsed = parse({"--indent", value});
    REQUIRE(parsed.errors.size() == 1);
    CHECK(parsed.errors[0] == std::string("Invalid value for --indent: ") + value);
    CHECK(parsed.config.indent == 2);
  }
}

TEST_CASE("validate_cli_config bounds the indent", "[cli][config]") {
  cli::CliConfig config;

  config.indent = cli::kMaxIndent;
  CHECK(cli::validate_cli_config(config).empty());

  config.indent = cli::kMaxIndent + 1;
  CHECK_FALSE(cli::validate_cli_config(config).empty());

  config.indent = -2;
  CHECK_FALSE(cli::validate_cli_config(config).empty());
}

TEST_CASE("--help is recorded and usage lists every flag", "[cli][config]") {
  const auto parsed = parse({"--help"});
  CHECK(parsed.errors.empty());
  CHECK(parsed.config.show_help);

  std::ostringstream out;
  apps::print_usage(out, "higlint_cli", cli::build_cli_options());
  const std::string usage = out.str();
  CHECK(usage.rfind("Usage: higlint_cli [options]", 0) == 0);
  CHECK(usage.find("--indent <value>") != std::string::npos);
  CHECK(usage.find("--input <value>") != std::string::npos);
  CHECK(usage.find("--help") != std::string::npos);
}
