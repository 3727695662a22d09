#pragma once

#include "toolexec/net/http_client.hpp"
#include "toolexec/sandbox/execution.hpp"

#include <memory>
#include <string>

namespace toolexec::executor {

/// Client of the per-call handler host. The host resolves the code itself, so only the id
/// and input travel.
class OnDemandExecutor {
public:
  OnDemandExecutor(std::string base_url, std::shared_ptr<net::HttpClient> http_client,
                   std::uint64_t request_timeout_ms);

  /// POST /execute {id, input}. Same failure semantics as ResidentExecutor::execute.
  [[nodiscard]] common::Result<sandbox::ExecutionResult>
  execute(const sandbox::ExecutionRequest &request) const;

  [[nodiscard]] const std::string &base_url() const { return base_url_; }

private:
  std::string base_url_;
  std::shared_ptr<net::HttpClient> http_client_;
  std::uint64_t request_timeout_ms_;
};

} // namespace toolexec::executor
