#include "toolexec/sandbox/process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

namespace toolexec::sandbox {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

/// Drain everything currently readable. Bytes past `limit` are read and dropped so the
/// child never blocks on a full pipe. Returns false once the write end is closed.
bool read_into_buffer(const int fd, std::string &buffer, const std::size_t limit,
                      bool &truncated) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const auto count = static_cast<std::size_t>(bytes);
      if (buffer.size() < limit) {
        const std::size_t room = limit - buffer.size();
        buffer.append(chunk.data(), std::min(room, count));
        truncated = truncated || count > room;
      } else {
        truncated = true;
      }
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

struct Pipe {
  int read_end = -1;
  int write_end = -1;

  ~Pipe() {
    close_fd(read_end);
    close_fd(write_end);
  }

  [[nodiscard]] bool open(const int flags) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, flags) != 0) {
      return false;
    }
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }
};

std::vector<std::string> split_command(const std::string &interpreter) {
  std::vector<std::string> parts;
  std::istringstream stream(interpreter);
  std::string part;
  while (stream >> part) {
    parts.push_back(part);
  }
  return parts;
}

RunOutcome spawn_failure(std::string message) {
  RunOutcome outcome;
  outcome.status = RunStatus::SpawnFailed;
  outcome.message = std::move(message);
  return outcome;
}

} // namespace

ProcessRunner::ProcessRunner(std::string interpreter, const std::size_t max_output_bytes)
    : command_(split_command(interpreter)), max_output_bytes_(max_output_bytes) {}

std::optional<std::string> ProcessRunner::resolve_program() const {
  if (command_.empty()) {
    return std::nullopt;
  }
  const std::string &program = command_.front();
  std::error_code ec;
  if (program.find('/') != std::string::npos) {
    const auto absolute = std::filesystem::absolute(program, ec);
    return ec ? program : absolute.string();
  }
  const char *path_env = std::getenv("PATH");
  std::istringstream dirs(path_env != nullptr ? path_env : "/usr/bin:/bin");
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    const auto candidate =
        std::filesystem::absolute(std::filesystem::path(dir.empty() ? "." : dir) / program, ec);
    if (!ec && access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
  }
  return std::nullopt;
}

bool ProcessRunner::interpreter_available() const {
  const auto program = resolve_program();
  return program.has_value() && access(program->c_str(), X_OK) == 0;
}

RunOutcome ProcessRunner::run(const std::filesystem::path &file_path,
                              const std::string &input_json,
                              const std::chrono::milliseconds timeout) const {
  if (command_.empty()) {
    return spawn_failure("No interpreter configured");
  }

  Pipe stdout_pipe;
  Pipe stderr_pipe;
  Pipe exec_status;
  if (!stdout_pipe.open(O_CLOEXEC) || !stderr_pipe.open(O_CLOEXEC) ||
      !exec_status.open(O_CLOEXEC)) {
    return spawn_failure(std::string("Failed to create pipes: ") + std::strerror(errno));
  }

  // Everything the child touches is prepared before fork; the child only calls execv.
  const auto program = resolve_program();
  if (!program.has_value()) {
    return spawn_failure("Failed to start interpreter '" + command_.front() +
                         "': not found on PATH");
  }
  const std::string script = file_path.string();
  const std::string working_dir = file_path.parent_path().string();
  std::vector<char *> argv;
  argv.reserve(command_.size() + 3);
  for (const auto &part : command_) {
    argv.push_back(const_cast<char *>(part.c_str()));
  }
  argv.push_back(const_cast<char *>(script.c_str()));
  argv.push_back(const_cast<char *>(input_json.c_str()));
  argv.push_back(nullptr);

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    return spawn_failure(std::string("Failed to fork: ") + std::strerror(errno));
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      (void)dup2(null_fd, STDIN_FILENO);
      if (null_fd > STDERR_FILENO) {
        close(null_fd);
      }
    }
    (void)dup2(stdout_pipe.write_end, STDOUT_FILENO);
    (void)dup2(stderr_pipe.write_end, STDERR_FILENO);
    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
      const int err = errno;
      (void)!write(exec_status.write_end, &err, sizeof(err));
      _exit(127);
    }
    execv(program->c_str(), argv.data());
    const int err = errno;
    (void)!write(exec_status.write_end, &err, sizeof(err));
    _exit(127);
  }

  (void)setpgid(pid, pid);
  close_fd(stdout_pipe.write_end);
  close_fd(stderr_pipe.write_end);
  close_fd(exec_status.write_end);

  int exec_errno = 0;
  ssize_t status_bytes = 0;
  do {
    status_bytes = read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
  } while (status_bytes < 0 && errno == EINTR);
  if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
    int ignored = 0;
    (void)waitpid(pid, &ignored, 0);
    return spawn_failure("Failed to start interpreter '" + command_.front() +
                         "': " + std::strerror(exec_errno));
  }

  set_non_blocking(stdout_pipe.read_end);
  set_non_blocking(stderr_pipe.read_end);

  RunOutcome outcome;
  int status = 0;
  bool timed_out = false;
  bool lost_child = false;
  int wait_errno = 0;
  bool stdout_open = true;
  bool stderr_open = true;

  while (true) {
    if (stdout_open) {
      stdout_open = read_into_buffer(stdout_pipe.read_end, outcome.stdout_text, max_output_bytes_,
                                     outcome.output_truncated);
    }
    if (stderr_open) {
      stderr_open = read_into_buffer(stderr_pipe.read_end, outcome.stderr_text, max_output_bytes_,
                                     outcome.output_truncated);
    }

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      lost_child = true;
      wait_errno = errno;
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed >= timeout) {
      timed_out = true;
      (void)kill(-pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(timeout - elapsed).count();
    const int wait_ms = static_cast<int>(std::min<long long>(50, remaining + 1));
    struct pollfd poll_fds[2] = {
        {.fd = stdout_open ? stdout_pipe.read_end : -1, .events = POLLIN, .revents = 0},
        {.fd = stderr_open ? stderr_pipe.read_end : -1, .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, wait_ms);
  }

  // Stragglers left in the group by the script.
  (void)kill(-pid, SIGKILL);

  if (stdout_open) {
    (void)read_into_buffer(stdout_pipe.read_end, outcome.stdout_text, max_output_bytes_,
                           outcome.output_truncated);
  }
  if (stderr_open) {
    (void)read_into_buffer(stderr_pipe.read_end, outcome.stderr_text, max_output_bytes_,
                           outcome.output_truncated);
  }

  outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (lost_child) {
    outcome.status = RunStatus::SpawnFailed;
    outcome.message = std::string("Lost track of interpreter process: ") + std::strerror(wait_errno);
  } else if (timed_out) {
    outcome.status = RunStatus::TimedOut;
  } else if (WIFEXITED(status)) {
    outcome.status = RunStatus::Exited;
    outcome.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    outcome.status = RunStatus::Signaled;
    outcome.signal = WTERMSIG(status);
  }
  return outcome;
}

ExecutionResult to_execution_result(const RunOutcome &outcome,
                                    const std::chrono::milliseconds timeout) {
  switch (outcome.status) {
  case RunStatus::Exited:
    if (outcome.exit_code == 0) {
      return ExecutionResult::succeeded(outcome.stdout_text);
    }
    // A failed run is never reported as success, even with an empty stderr.
    return ExecutionResult::failed(ErrorKind::InterpreterFailure,
                                   outcome.stderr_text.empty()
                                       ? "Process exited with code " +
                                             std::to_string(outcome.exit_code)
                                       : outcome.stderr_text);
  case RunStatus::Signaled:
    return ExecutionResult::failed(ErrorKind::InterpreterFailure,
                                   outcome.stderr_text.empty()
                                       ? "Process terminated by signal " +
                                             std::to_string(outcome.signal)
                                       : outcome.stderr_text);
  case RunStatus::TimedOut:
    return ExecutionResult::failed(ErrorKind::InvocationTimeout,
                                   timeout_message(static_cast<std::uint64_t>(timeout.count())));
  case RunStatus::SpawnFailed:
    break;
  }
  return ExecutionResult::failed(ErrorKind::SpawnFailure, outcome.message);
}

} // namespace toolexec::sandbox
