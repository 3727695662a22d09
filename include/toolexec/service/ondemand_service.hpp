#pragma once

#include "toolexec/config/schema.hpp"
#include "toolexec/net/http_server.hpp"
#include "toolexec/sandbox/execution.hpp"
#include "toolexec/service/resident_service.hpp"
#include "toolexec/store/code_store.hpp"

#include <memory>

namespace toolexec::service {

struct HandlerReply {
  int status = 200;
  sandbox::ExecutionResult result;
};

/// One per request: resolve the code by id, then run it in a fresh local sandbox.
class OnDemandHandler {
public:
  OnDemandHandler(const config::ExecutionConfig &execution, store::ICodeStore &code_store);

  [[nodiscard]] HandlerReply run(const std::string &id, const std::string &input_json) const;

private:
  const config::ExecutionConfig &execution_;
  store::ICodeStore &code_store_;
};

/// Handler host: POST /execute {id, input}, POST|GET /functions/execute/<id>, GET /health.
class OnDemandService {
public:
  OnDemandService(const config::Config &config, std::shared_ptr<store::ICodeStore> code_store);
  ~OnDemandService();

  [[nodiscard]] common::Status start(const ServiceOptions &options);
  void stop();
  [[nodiscard]] std::uint16_t port() const { return server_.port(); }

  [[nodiscard]] net::ServerResponse handle(const net::HttpRequest &request) const;
  [[nodiscard]] net::ServerResponse dispatch_for_test(const net::HttpRequest &request) const;

private:
  [[nodiscard]] net::ServerResponse reply(const std::string &id,
                                          const std::string &input_json) const;

  config::Config config_;
  std::shared_ptr<store::ICodeStore> code_store_;
  net::HttpServer server_;
};

} // namespace toolexec::service
