#pragma once

#include "toolexec/executor/ondemand.hpp"
#include "toolexec/executor/resident.hpp"

#include <string_view>
#include <variant>

namespace toolexec::executor {

using SandboxExecutor = std::variant<ResidentExecutor, OnDemandExecutor>;

[[nodiscard]] common::Result<sandbox::ExecutionResult>
execute(const SandboxExecutor &executor, const sandbox::ExecutionRequest &request);

/// "resident" or "ondemand".
[[nodiscard]] std::string_view tier_name(const SandboxExecutor &executor);

/// Interpret an executor response: a result body (any status) or a transport failure.
[[nodiscard]] common::Result<sandbox::ExecutionResult>
interpret_response(const net::HttpResponse &response, std::string_view tier);

} // namespace toolexec::executor
