#include "toolexec/executor/executor.hpp"

#include "toolexec/common/fs.hpp"

#include <type_traits>

namespace toolexec::executor {

namespace {

// Best-effort category for logs; the wire shape carries only text.
sandbox::ErrorKind classify_remote_failure(const std::uint16_t status, const std::string &error) {
  if (status == 404) {
    return sandbox::ErrorKind::LookupNotFound;
  }
  if (status == 400) {
    return sandbox::ErrorKind::InvalidRequest;
  }
  if (status == 503) {
    return sandbox::ErrorKind::UnhealthyExecutor;
  }
  if (common::starts_with(error, "Execution timed out after ")) {
    return sandbox::ErrorKind::InvocationTimeout;
  }
  return sandbox::ErrorKind::InterpreterFailure;
}

} // namespace

common::Result<sandbox::ExecutionResult> execute(const SandboxExecutor &executor,
                                                 const sandbox::ExecutionRequest &request) {
  return std::visit([&request](const auto &impl) { return impl.execute(request); }, executor);
}

std::string_view tier_name(const SandboxExecutor &executor) {
  return std::visit(
      [](const auto &impl) -> std::string_view {
        using T = std::decay_t<decltype(impl)>;
        if constexpr (std::is_same_v<T, ResidentExecutor>) {
          return "resident";
        } else {
          return "ondemand";
        }
      },
      executor);
}

common::Result<sandbox::ExecutionResult> interpret_response(const net::HttpResponse &response,
                                                            const std::string_view tier) {
  using ExecResult = common::Result<sandbox::ExecutionResult>;
  const std::string name(tier);
  if (response.network_error) {
    return ExecResult::failure(name + " executor unreachable: " + response.network_error_message);
  }

  auto parsed = sandbox::parse_execution_result(response.body);
  if (!parsed.ok()) {
    return ExecResult::failure(name + " executor returned HTTP " +
                               std::to_string(response.status) +
                               " without a result: " + parsed.error());
  }
  auto result = std::move(parsed.value());
  if (!result.success) {
    result.kind = classify_remote_failure(response.status, result.error.value_or(""));
  }
  return ExecResult::success(std::move(result));
}

} // namespace toolexec::executor
