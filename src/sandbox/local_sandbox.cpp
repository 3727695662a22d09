#include "toolexec/sandbox/local_sandbox.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/common/json_util.hpp"
#include "toolexec/observability/global.hpp"

namespace toolexec::sandbox {

namespace {

void record_local_attempt(const std::string &code_id, const std::string &source_text,
                          const ExecutionResult &result, const std::chrono::milliseconds duration) {
  observability::record_execution_attempt(observability::ExecutionAttemptEvent{
      .tier = "local",
      .code_id = code_id,
      .code_digest = common::sha256_hex(source_text),
      .success = result.success,
      .error_kind = std::string(error_kind_name(result.kind)),
      .duration = duration,
  });
}

} // namespace

LocalSandbox::LocalSandbox(const config::ExecutionConfig &config)
    : workspaces_(config.workspace_root, config.script_filename),
      runner_(config.interpreter, config.max_output_bytes),
      budget_(std::chrono::milliseconds(config.timeout_ms)) {}

ExecutionResult LocalSandbox::execute(const std::string &source_text,
                                      const std::string &input_json,
                                      const std::string &code_id) const {
  const auto started = std::chrono::steady_clock::now();
  const auto finish = [&](ExecutionResult result) {
    record_local_attempt(code_id, source_text, result,
                         std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - started));
    return result;
  };

  if (const auto valid = common::json_validate(input_json); !valid.ok()) {
    return finish(ExecutionResult::failed(ErrorKind::InvalidRequest,
                                          "Input is not valid JSON: " + valid.error()));
  }

  auto acquired = workspaces_.acquire();
  if (!acquired.ok()) {
    return finish(ExecutionResult::failed(ErrorKind::SpawnFailure, acquired.error()));
  }
  WorkspaceLease lease = std::move(acquired.value());

  if (const auto written = lease.write(source_text); !written.ok()) {
    return finish(ExecutionResult::failed(ErrorKind::SpawnFailure, written.error()));
  }

  const RunOutcome outcome = runner_.run(lease.script_path(), input_json, budget_);
  lease.release();
  return finish(to_execution_result(outcome, budget_));
}

} // namespace toolexec::sandbox
