#include "toolexec/executor/resident.hpp"

#include "toolexec/common/json_util.hpp"
#include "toolexec/executor/executor.hpp"

namespace toolexec::executor {

ResidentExecutor::ResidentExecutor(std::string base_url,
                                   std::shared_ptr<net::HttpClient> http_client,
                                   const std::uint64_t request_timeout_ms,
                                   const std::uint64_t probe_timeout_ms)
    : base_url_(std::move(base_url)), http_client_(std::move(http_client)),
      request_timeout_ms_(request_timeout_ms), probe_timeout_ms_(probe_timeout_ms) {}

ProbeResult ResidentExecutor::probe() const {
  const auto response = http_client_->get(net::join_url(base_url_, "/health"), {},
                                          probe_timeout_ms_);
  if (response.network_error) {
    return ProbeResult{.healthy = false, .detail = response.network_error_message};
  }
  if (!response.is_success()) {
    return ProbeResult{.healthy = false, .detail = "HTTP " + std::to_string(response.status)};
  }
  const auto fields = common::json_object_fields(response.body);
  if (!fields.ok()) {
    return ProbeResult{.healthy = false, .detail = "unparseable health body"};
  }
  const auto status = common::json_field_string(fields.value(), "status");
  if (!status.has_value() || *status != "healthy") {
    return ProbeResult{.healthy = false, .detail = "status=" + status.value_or("missing")};
  }
  return ProbeResult{.healthy = true, .detail = ""};
}

common::Result<sandbox::ExecutionResult>
ResidentExecutor::execute(const sandbox::ExecutionRequest &request) const {
  if (!request.source_text.has_value()) {
    return common::Result<sandbox::ExecutionResult>::success(sandbox::ExecutionResult::failed(
        sandbox::ErrorKind::InvalidRequest, "No code provided"));
  }
  const std::string body = "{\"code\":" + common::json_quote(*request.source_text) +
                           ",\"input\":" + request.input_json + "}";
  const auto response =
      http_client_->post_json(net::join_url(base_url_, "/execute"), {}, body, request_timeout_ms_);
  return interpret_response(response, "resident");
}

} // namespace toolexec::executor
