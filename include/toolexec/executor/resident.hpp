#pragma once

#include "toolexec/net/http_client.hpp"
#include "toolexec/sandbox/execution.hpp"

#include <memory>
#include <string>

namespace toolexec::executor {

struct ProbeResult {
  bool healthy = false;
  std::string detail;
};

/// Client of the long-running loopback executor.
class ResidentExecutor {
public:
  ResidentExecutor(std::string base_url, std::shared_ptr<net::HttpClient> http_client,
                   std::uint64_t request_timeout_ms, std::uint64_t probe_timeout_ms);

  /// GET /health. Healthy only on a 2xx JSON object whose "status" is "healthy".
  [[nodiscard]] ProbeResult probe() const;

  /// POST /execute {code, input}. A failure means the call itself failed (transport error or a
  /// body that is not a result); a well-formed result is returned as-is, successful or not.
  [[nodiscard]] common::Result<sandbox::ExecutionResult>
  execute(const sandbox::ExecutionRequest &request) const;

  [[nodiscard]] const std::string &base_url() const { return base_url_; }

private:
  std::string base_url_;
  std::shared_ptr<net::HttpClient> http_client_;
  std::uint64_t request_timeout_ms_;
  std::uint64_t probe_timeout_ms_;
};

} // namespace toolexec::executor
