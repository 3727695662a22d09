#pragma once

#include "toolexec/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace toolexec::sandbox {

/// Failure category. Carried in logs only; callers see the uniform result shape.
enum class ErrorKind {
  None,
  LookupNotFound,
  UnhealthyExecutor,
  TransportFailure,
  InterpreterFailure,
  InvocationTimeout,
  CleanupFailure,
  InvalidRequest,
  SpawnFailure,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

struct ExecutionRequest {
  std::string code_id;
  // Raw JSON text of the input value.
  std::string input_json = "{}";
  std::optional<std::string> source_text;
};

struct ExecutionResult {
  bool success = false;
  std::string output;
  std::optional<std::string> error;
  // Not serialized.
  ErrorKind kind = ErrorKind::None;

  [[nodiscard]] static ExecutionResult succeeded(std::string output);
  [[nodiscard]] static ExecutionResult failed(ErrorKind kind, std::string message);

  /// {"success":bool,"output":string,"error":string|null}
  [[nodiscard]] std::string to_json() const;
};

/// Parse a result body. Fails unless `success` is a boolean and `output` a string.
[[nodiscard]] common::Result<ExecutionResult> parse_execution_result(const std::string &json);

/// Render a millisecond budget the way the timeout message shows it: 5000 -> "5", 2500 -> "2.5".
[[nodiscard]] std::string format_budget_seconds(std::uint64_t timeout_ms);
[[nodiscard]] std::string timeout_message(std::uint64_t timeout_ms);

} // namespace toolexec::sandbox
