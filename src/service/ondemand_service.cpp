#include "toolexec/service/ondemand_service.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/common/json_util.hpp"
#include "toolexec/health/health.hpp"
#include "toolexec/sandbox/local_sandbox.hpp"

namespace toolexec::service {

namespace {

using sandbox::ErrorKind;
using sandbox::ExecutionResult;

constexpr const char *kLegacyRoutePrefix = "/functions/execute/";

} // namespace

OnDemandHandler::OnDemandHandler(const config::ExecutionConfig &execution,
                                 store::ICodeStore &code_store)
    : execution_(execution), code_store_(code_store) {}

HandlerReply OnDemandHandler::run(const std::string &id, const std::string &input_json) const {
  if (common::trim(id).empty()) {
    return HandlerReply{.status = 400,
                        .result = ExecutionResult::failed(ErrorKind::InvalidRequest,
                                                          "Missing function id")};
  }

  const auto lookup = store::lookup_code(code_store_, id);
  if (!lookup.ok()) {
    return HandlerReply{.status = 500,
                        .result = ExecutionResult::failed(ErrorKind::TransportFailure,
                                                          lookup.error())};
  }
  if (!lookup.value().has_value()) {
    return HandlerReply{.status = 404,
                        .result = ExecutionResult::failed(ErrorKind::LookupNotFound,
                                                          std::string(store::kNotFoundMessage))};
  }

  const sandbox::LocalSandbox sandbox(execution_);
  return HandlerReply{.status = 200,
                      .result = sandbox.execute(lookup.value()->source_text, input_json, id)};
}

OnDemandService::OnDemandService(const config::Config &config,
                                 std::shared_ptr<store::ICodeStore> code_store)
    : config_(config), code_store_(std::move(code_store)),
      server_([this](const net::HttpRequest &request) { return handle(request); }) {}

OnDemandService::~OnDemandService() { stop(); }

common::Status OnDemandService::start(const ServiceOptions &options) {
  health::mark_component_starting("ondemand");
  net::ServerOptions server_options;
  server_options.host = options.host;
  server_options.port = options.port;
  server_options.max_concurrent_requests = config_.server.max_concurrent_requests;
  server_options.max_body_bytes = config_.server.max_body_bytes;
  server_options.error_body = result_error_body;

  auto status = server_.start(server_options);
  if (!status.ok()) {
    health::mark_component_error("ondemand", status.error());
    return status;
  }
  health::mark_component_ok("ondemand");
  return common::Status::success();
}

void OnDemandService::stop() { server_.stop(); }

net::ServerResponse OnDemandService::dispatch_for_test(const net::HttpRequest &request) const {
  return server_.dispatch_for_test(request);
}

net::ServerResponse OnDemandService::reply(const std::string &id,
                                           const std::string &input_json) const {
  const OnDemandHandler handler(config_.execution, *code_store_);
  const auto outcome = handler.run(id, input_json);
  return result_response(outcome.status, outcome.result);
}

net::ServerResponse OnDemandService::handle(const net::HttpRequest &request) const {
  if (request.path == "/health") {
    return net::make_json_response(200, health::report_json("ondemand"));
  }

  if (request.path == "/execute") {
    if (request.method != "POST") {
      return net::make_json_response(405, result_error_body("Method not allowed"));
    }
    const auto fields = common::json_object_fields(request.body);
    if (!fields.ok()) {
      return result_response(
          400, ExecutionResult::failed(ErrorKind::InvalidRequest, "No JSON data provided"));
    }
    const auto id = common::json_field_string(fields.value(), "id");
    std::string input = "{}";
    if (const auto it = fields.value().find("input"); it != fields.value().end()) {
      input = it->second;
    }
    return reply(id.value_or(""), input);
  }

  if (common::starts_with(request.path, kLegacyRoutePrefix)) {
    if (request.method != "POST" && request.method != "GET") {
      return net::make_json_response(405, result_error_body("Method not allowed"));
    }
    const std::string id = request.path.substr(request.path.rfind('/') + 1);
    // The raw body is the input; anything unparseable becomes {}.
    std::string input = "{}";
    if (request.method == "POST" && common::json_validate(request.body).ok()) {
      input = common::trim(request.body);
    }
    return reply(id, input);
  }

  return net::make_json_response(404, result_error_body("Not found"));
}

} // namespace toolexec::service
