#include "toolexec/orchestrator/orchestrator.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/common/json_util.hpp"
#include "toolexec/observability/global.hpp"

#include <chrono>

namespace toolexec::orchestrator {

namespace {

using sandbox::ErrorKind;
using sandbox::ExecutionResult;
using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(const Clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
}

void record_attempt(const std::string_view tier, const sandbox::ExecutionRequest &request,
                    const bool success, const ErrorKind kind,
                    const std::chrono::milliseconds duration) {
  observability::record_execution_attempt(observability::ExecutionAttemptEvent{
      .tier = std::string(tier),
      .code_id = request.code_id,
      .code_digest = request.source_text.has_value() ? common::sha256_hex(*request.source_text)
                                                     : std::string(),
      .success = success,
      .error_kind = std::string(sandbox::error_kind_name(kind)),
      .duration = duration,
  });
}

} // namespace

std::string strip_tool_decorators(const std::string &source_text) {
  static const std::string marker = "@tool()";
  std::string out;
  out.reserve(source_text.size());
  std::size_t pos = 0;
  while (pos < source_text.size()) {
    const auto found = source_text.find(marker, pos);
    if (found == std::string::npos) {
      break;
    }
    const auto newline = source_text.find('\n', found + marker.size());
    if (newline == std::string::npos) {
      // Without a terminating newline the marker stays.
      break;
    }
    out.append(source_text, pos, found - pos);
    pos = newline + 1;
  }
  out.append(source_text, pos, std::string::npos);
  return out;
}

ExecutionOrchestrator::ExecutionOrchestrator(executor::ResidentExecutor resident,
                                             executor::OnDemandExecutor ondemand,
                                             std::shared_ptr<store::ICodeStore> code_store)
    : resident_(std::move(resident)), ondemand_(std::move(ondemand)),
      code_store_(std::move(code_store)) {}

ExecutionOrchestrator
ExecutionOrchestrator::from_config(const config::Config &config,
                                   std::shared_ptr<net::HttpClient> http_client,
                                   std::shared_ptr<store::ICodeStore> code_store) {
  return ExecutionOrchestrator(
      executor::ResidentExecutor(config.resident.url, http_client, config.http.request_timeout_ms,
                                 config.resident.probe_timeout_ms),
      executor::OnDemandExecutor(config.ondemand.url, http_client,
                                 config.http.request_timeout_ms),
      std::move(code_store));
}

executor::SandboxExecutor ExecutionOrchestrator::select_executor() const {
  const auto started = Clock::now();
  const auto probe = resident_.probe();
  observability::record_probe(resident_.base_url(), probe.healthy, probe.detail, since(started));
  if (probe.healthy) {
    return resident_;
  }
  return ondemand_;
}

ExecutionResult ExecutionOrchestrator::run_fallback(const sandbox::ExecutionRequest &request) {
  const auto started = Clock::now();
  const executor::SandboxExecutor fallback = ondemand_;
  auto attempt = executor::execute(fallback, request);
  if (!attempt.ok()) {
    record_attempt(executor::tier_name(fallback), request, false, ErrorKind::TransportFailure,
                   since(started));
    return ExecutionResult::failed(ErrorKind::TransportFailure, attempt.error());
  }
  auto result = std::move(attempt.value());
  record_attempt(executor::tier_name(fallback), request, result.success, result.kind,
                 since(started));
  return result;
}

ExecutionResult ExecutionOrchestrator::execute_tool(const std::string &id,
                                                    const std::string &input_json) {
  if (const auto valid = common::json_validate(input_json); !valid.ok()) {
    observability::record_error("orchestrator", "rejected input for " + id + ": " + valid.error());
    return ExecutionResult::failed(ErrorKind::InvalidRequest,
                                   "Input is not valid JSON: " + valid.error());
  }

  sandbox::ExecutionRequest request{.code_id = id, .input_json = input_json, .source_text = {}};
  const executor::SandboxExecutor selected = select_executor();
  if (std::holds_alternative<executor::OnDemandExecutor>(selected)) {
    return run_fallback(request);
  }

  const auto started = Clock::now();
  auto lookup = store::lookup_code(*code_store_, id);
  if (!lookup.ok()) {
    record_attempt(executor::tier_name(selected), request, false, ErrorKind::TransportFailure,
                   since(started));
    return run_fallback(request);
  }
  if (!lookup.value().has_value()) {
    record_attempt(executor::tier_name(selected), request, false, ErrorKind::LookupNotFound,
                   since(started));
    return ExecutionResult::failed(ErrorKind::LookupNotFound, std::string(store::kNotFoundMessage));
  }

  request.source_text = strip_tool_decorators(lookup.value()->source_text);
  auto attempt = executor::execute(selected, request);
  if (!attempt.ok()) {
    observability::record_error("orchestrator", attempt.error());
    record_attempt(executor::tier_name(selected), request, false, ErrorKind::TransportFailure,
                   since(started));
    return run_fallback(request);
  }

  auto result = std::move(attempt.value());
  record_attempt(executor::tier_name(selected), request, result.success, result.kind,
                 since(started));
  if (result.kind == ErrorKind::UnhealthyExecutor) {
    // Resident refused the work (at capacity); the script never ran there.
    return run_fallback(request);
  }
  return result;
}

} // namespace toolexec::orchestrator
