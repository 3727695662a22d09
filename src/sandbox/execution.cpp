#include "toolexec/sandbox/execution.hpp"

#include "toolexec/common/json_util.hpp"

namespace toolexec::sandbox {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "";
  case ErrorKind::LookupNotFound:
    return "LookupNotFound";
  case ErrorKind::UnhealthyExecutor:
    return "UnhealthyExecutor";
  case ErrorKind::TransportFailure:
    return "TransportFailure";
  case ErrorKind::InterpreterFailure:
    return "InterpreterFailure";
  case ErrorKind::InvocationTimeout:
    return "InvocationTimeout";
  case ErrorKind::CleanupFailure:
    return "CleanupFailure";
  case ErrorKind::InvalidRequest:
    return "InvalidRequest";
  case ErrorKind::SpawnFailure:
    return "SpawnFailure";
  }
  return "";
}

ExecutionResult ExecutionResult::succeeded(std::string output) {
  ExecutionResult result;
  result.success = true;
  result.output = std::move(output);
  return result;
}

ExecutionResult ExecutionResult::failed(const ErrorKind kind, std::string message) {
  ExecutionResult result;
  result.success = false;
  result.error = std::move(message);
  result.kind = kind;
  return result;
}

std::string ExecutionResult::to_json() const {
  std::string json = "{\"success\":";
  json += success ? "true" : "false";
  json += ",\"output\":" + common::json_quote(output);
  json += ",\"error\":";
  json += error.has_value() ? common::json_quote(*error) : "null";
  json += "}";
  return json;
}

common::Result<ExecutionResult> parse_execution_result(const std::string &json) {
  const auto fields = common::json_object_fields(json);
  if (!fields.ok()) {
    return common::Result<ExecutionResult>::failure("result is not a JSON object: " +
                                                    fields.error());
  }

  const auto success = common::json_field_bool(fields.value(), "success");
  if (!success.has_value()) {
    return common::Result<ExecutionResult>::failure("result is missing boolean 'success'");
  }
  auto output = common::json_field_string(fields.value(), "output");
  if (!output.has_value()) {
    return common::Result<ExecutionResult>::failure("result is missing string 'output'");
  }

  ExecutionResult result;
  result.success = *success;
  result.output = std::move(*output);
  result.error = common::json_field_string(fields.value(), "error");
  return common::Result<ExecutionResult>::success(std::move(result));
}

std::string format_budget_seconds(const std::uint64_t timeout_ms) {
  std::string text = std::to_string(timeout_ms / 1000);
  const std::uint64_t millis = timeout_ms % 1000;
  if (millis == 0) {
    return text;
  }
  std::string fraction = std::to_string(millis);
  fraction.insert(0, 3 - fraction.size(), '0');
  while (!fraction.empty() && fraction.back() == '0') {
    fraction.pop_back();
  }
  return text + "." + fraction;
}

std::string timeout_message(const std::uint64_t timeout_ms) {
  return "Execution timed out after " + format_budget_seconds(timeout_ms) + " seconds";
}

} // namespace toolexec::sandbox
