#pragma once

#include "toolexec/config/schema.hpp"
#include "toolexec/sandbox/execution.hpp"
#include "toolexec/sandbox/process_runner.hpp"
#include "toolexec/sandbox/workspace.hpp"

#include <chrono>
#include <string>

namespace toolexec::sandbox {

/// One bounded execution: lease a workspace, write the script, run it, release the workspace.
class LocalSandbox {
public:
  explicit LocalSandbox(const config::ExecutionConfig &config);

  [[nodiscard]] ExecutionResult execute(const std::string &source_text,
                                        const std::string &input_json,
                                        const std::string &code_id = "") const;

  [[nodiscard]] std::chrono::milliseconds budget() const { return budget_; }
  [[nodiscard]] const WorkspaceManager &workspaces() const { return workspaces_; }

private:
  WorkspaceManager workspaces_;
  ProcessRunner runner_;
  std::chrono::milliseconds budget_;
};

} // namespace toolexec::sandbox
