#include "higlint/protocol/request_handler.h"

#include "higlint/protocol/analysis_request.h"
#include "higlint/protocol/response_json.h"

#include <exception>
#include <string>

namespace higlint::protocol {

namespace {

Response respond(const analysis::Analyzer& analyzer, const RequestResult& decoded) {
  if (!decoded.has_value()) {
    const RequestError& error = decoded.error();
    const int exit_code =
        error.kind == RequestErrorKind::kMissingCode ? kExitOk : kExitFailure;
    return Response{error_to_json(error.message), exit_code};
  }

  try {
    const auto result = analyzer.analyze(decoded.value().code);
    return Response{result_to_json(result), kExitOk};
  } catch (const std::exception& e) {
    return Response{error_to_json(std::string(kAnalysisFailedPrefix) + e.what()), kExitFailure};
  }
}

}  // namespace

Response respond_to_request(const analysis::Analyzer& analyzer, const std::string& input) {
  return respond(analyzer, parse_analysis_request(input));
}

Response respond_to_arguments(const analysis::Analyzer& analyzer, const nlohmann::json& arguments,
                              std::optional<std::size_t> max_code_bytes) {
  return respond(analyzer, request_from_json(arguments, max_code_bytes));
}

}  // namespace higlint::protocol
