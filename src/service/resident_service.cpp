#include "toolexec/service/resident_service.hpp"

#include "toolexec/common/json_util.hpp"
#include "toolexec/health/health.hpp"
#include "toolexec/sandbox/process_runner.hpp"

namespace toolexec::service {

using sandbox::ErrorKind;
using sandbox::ExecutionResult;

std::string result_error_body(const std::string &message) {
  return ExecutionResult::failed(ErrorKind::None, message).to_json();
}

net::ServerResponse result_response(const int status, const ExecutionResult &result) {
  return net::make_json_response(status, result.to_json());
}

ResidentService::ResidentService(const config::Config &config)
    : config_(config), sandbox_(config.execution),
      server_([this](const net::HttpRequest &request) { return handle(request); }) {}

ResidentService::~ResidentService() { stop(); }

void ResidentService::check_components() const {
  const sandbox::ProcessRunner runner(config_.execution.interpreter);
  if (runner.interpreter_available()) {
    health::mark_component_ok("interpreter");
  } else {
    health::mark_component_error("interpreter",
                                 "interpreter not found: " + config_.execution.interpreter);
  }

  auto lease = sandbox_.workspaces().acquire();
  if (lease.ok()) {
    health::mark_component_ok("workspace");
  } else {
    health::mark_component_error("workspace", lease.error());
  }
}

common::Status ResidentService::start(const ServiceOptions &options) {
  health::mark_component_starting("server");
  check_components();

  net::ServerOptions server_options;
  server_options.host = options.host;
  server_options.port = options.port;
  server_options.max_concurrent_requests = config_.server.max_concurrent_requests;
  server_options.max_body_bytes = config_.server.max_body_bytes;
  server_options.error_body = result_error_body;

  auto status = server_.start(server_options);
  if (!status.ok()) {
    health::mark_component_error("server", status.error());
    return status;
  }
  health::mark_component_ok("server");
  return common::Status::success();
}

void ResidentService::stop() { server_.stop(); }

net::ServerResponse ResidentService::dispatch_for_test(const net::HttpRequest &request) const {
  return server_.dispatch_for_test(request);
}

net::ServerResponse ResidentService::handle(const net::HttpRequest &request) const {
  if (request.path == "/health") {
    return net::make_json_response(200, health::report_json("resident"));
  }
  if (request.path == "/execute") {
    if (request.method != "POST") {
      return net::make_json_response(405, result_error_body("Method not allowed"));
    }
    return handle_execute(request);
  }
  return net::make_json_response(404, result_error_body("Not found"));
}

net::ServerResponse ResidentService::handle_execute(const net::HttpRequest &request) const {
  const auto fields = common::json_object_fields(request.body);
  if (!fields.ok()) {
    return result_response(
        400, ExecutionResult::failed(ErrorKind::InvalidRequest, "No JSON data provided"));
  }

  const auto code = common::json_field_string(fields.value(), "code");
  if (!code.has_value() || code->empty()) {
    return result_response(400,
                           ExecutionResult::failed(ErrorKind::InvalidRequest, "No code provided"));
  }

  std::string input = "{}";
  if (const auto it = fields.value().find("input"); it != fields.value().end()) {
    input = it->second;
  }
  return result_response(200, sandbox_.execute(*code, input));
}

} // namespace toolexec::service
