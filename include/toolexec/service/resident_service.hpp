#pragma once

#include "toolexec/config/schema.hpp"
#include "toolexec/net/http_server.hpp"
#include "toolexec/sandbox/local_sandbox.hpp"

namespace toolexec::service {

struct ServiceOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 0;
};

/// Long-running loopback executor: GET /health, POST /execute {code, input}.
class ResidentService {
public:
  explicit ResidentService(const config::Config &config);
  ~ResidentService();

  [[nodiscard]] common::Status start(const ServiceOptions &options);
  void stop();
  [[nodiscard]] std::uint16_t port() const { return server_.port(); }

  /// Refresh the interpreter and workspace health components.
  void check_components() const;

  [[nodiscard]] net::ServerResponse handle(const net::HttpRequest &request) const;
  [[nodiscard]] net::ServerResponse dispatch_for_test(const net::HttpRequest &request) const;

private:
  [[nodiscard]] net::ServerResponse handle_execute(const net::HttpRequest &request) const;

  config::Config config_;
  sandbox::LocalSandbox sandbox_;
  net::HttpServer server_;
};

/// Server-generated errors rendered in the result shape.
[[nodiscard]] std::string result_error_body(const std::string &message);
[[nodiscard]] net::ServerResponse result_response(int status,
                                                  const sandbox::ExecutionResult &result);

} // namespace toolexec::service
