#pragma once

#include "toolexec/sandbox/execution.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolexec::sandbox {

enum class RunStatus { Exited, Signaled, TimedOut, SpawnFailed };

struct RunOutcome {
  RunStatus status = RunStatus::SpawnFailed;
  int exit_code = -1;
  int signal = 0;
  std::string stdout_text;
  std::string stderr_text;
  bool output_truncated = false;
  // Spawn/IO failure description.
  std::string message;
  std::chrono::milliseconds duration{0};
};

/// Spawns `<interpreter> <file> <input_json>` in the file's directory with stdin from /dev/null,
/// in its own process group. The whole group is killed with SIGKILL once the timeout expires.
class ProcessRunner {
public:
  explicit ProcessRunner(std::string interpreter, std::size_t max_output_bytes = 1024 * 1024);

  [[nodiscard]] RunOutcome run(const std::filesystem::path &file_path,
                               const std::string &input_json,
                               std::chrono::milliseconds timeout) const;

  [[nodiscard]] const std::vector<std::string> &command() const { return command_; }

  /// Absolute path of the interpreter program: bare names are looked up on PATH, others are
  /// made absolute. nullopt when a bare name is not found.
  [[nodiscard]] std::optional<std::string> resolve_program() const;

  /// Whether the interpreter program resolves to an executable file.
  [[nodiscard]] bool interpreter_available() const;

private:
  std::vector<std::string> command_;
  std::size_t max_output_bytes_;
};

/// Map a process outcome onto the caller-visible result shape.
[[nodiscard]] ExecutionResult to_execution_result(const RunOutcome &outcome,
                                                  std::chrono::milliseconds timeout);

} // namespace toolexec::sandbox
