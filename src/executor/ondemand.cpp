#include "toolexec/executor/ondemand.hpp"

#include "toolexec/common/json_util.hpp"
#include "toolexec/executor/executor.hpp"

namespace toolexec::executor {

OnDemandExecutor::OnDemandExecutor(std::string base_url,
                                   std::shared_ptr<net::HttpClient> http_client,
                                   const std::uint64_t request_timeout_ms)
    : base_url_(std::move(base_url)), http_client_(std::move(http_client)),
      request_timeout_ms_(request_timeout_ms) {}

common::Result<sandbox::ExecutionResult>
OnDemandExecutor::execute(const sandbox::ExecutionRequest &request) const {
  const std::string body = "{\"id\":" + common::json_quote(request.code_id) +
                           ",\"input\":" + request.input_json + "}";
  const auto response =
      http_client_->post_json(net::join_url(base_url_, "/execute"), {}, body, request_timeout_ms_);
  return interpret_response(response, "ondemand");
}

} // namespace toolexec::executor
