#pragma once

#include "higlint/analysis/analyzer.h"

#include "config.h"
#include <ostream>

namespace higlint::mcp {

// ServerContext holds all process-lifetime references passed to every handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  const analysis::Analyzer& analyzer;  // NOLINT(readability-identifier-naming)
  const McpServerConfig& config;       // NOLINT(readability-identifier-naming)
  std::ostream& log;                   // NOLINT(readability-identifier-naming)
};

}  // namespace higlint::mcp
