#pragma once

#include "toolexec/config/schema.hpp"
#include "toolexec/executor/executor.hpp"
#include "toolexec/store/code_store.hpp"

#include <memory>
#include <string>

namespace toolexec::orchestrator {

/// Caller-side routing: probe the resident executor, run there when it is healthy, otherwise
/// hand the request to the on-demand tier. Only the terminal attempt's result is returned.
class ExecutionOrchestrator {
public:
  ExecutionOrchestrator(executor::ResidentExecutor resident, executor::OnDemandExecutor ondemand,
                        std::shared_ptr<store::ICodeStore> code_store);

  [[nodiscard]] static ExecutionOrchestrator
  from_config(const config::Config &config, std::shared_ptr<net::HttpClient> http_client,
              std::shared_ptr<store::ICodeStore> code_store);

  [[nodiscard]] sandbox::ExecutionResult execute_tool(const std::string &id,
                                                      const std::string &input_json);

  /// Probe once and return the executor a request would be routed to.
  [[nodiscard]] executor::SandboxExecutor select_executor() const;

private:
  [[nodiscard]] sandbox::ExecutionResult run_fallback(const sandbox::ExecutionRequest &request);

  executor::ResidentExecutor resident_;
  executor::OnDemandExecutor ondemand_;
  std::shared_ptr<store::ICodeStore> code_store_;
};

/// Remove every "@tool()" marker together with the rest of its line.
[[nodiscard]] std::string strip_tool_decorators(const std::string &source_text);

} // namespace toolexec::orchestrator
