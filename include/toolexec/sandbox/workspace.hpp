#pragma once

#include "toolexec/common/result.hpp"

#include <filesystem>
#include <string>

namespace toolexec::sandbox {

/// Exclusive ownership of one ephemeral execution directory. The directory and everything
/// in it is removed when the lease is released or destroyed. Removal failures are reported
/// as CleanupFailure events and never surface to the caller.
class WorkspaceLease {
public:
  /// Take ownership of an existing directory; it is removed on release.
  [[nodiscard]] static WorkspaceLease adopt(std::filesystem::path directory,
                                            std::string script_filename);

  WorkspaceLease(WorkspaceLease &&other) noexcept;
  WorkspaceLease &operator=(WorkspaceLease &&other) noexcept;
  WorkspaceLease(const WorkspaceLease &) = delete;
  WorkspaceLease &operator=(const WorkspaceLease &) = delete;
  ~WorkspaceLease();

  [[nodiscard]] const std::filesystem::path &directory() const { return directory_; }
  [[nodiscard]] std::filesystem::path script_path() const { return directory_ / script_filename_; }
  [[nodiscard]] bool active() const { return !directory_.empty(); }

  /// Persist the script as the sole file of the workspace.
  [[nodiscard]] common::Status write(const std::string &source_text) const;

  void release() noexcept;

private:
  WorkspaceLease(std::filesystem::path directory, std::string script_filename);

  std::filesystem::path directory_;
  std::string script_filename_;
};

class WorkspaceManager {
public:
  /// An empty root means the system temp directory.
  WorkspaceManager(std::filesystem::path root, std::string script_filename);

  /// Create a fresh, uniquely named directory with mode 0700.
  [[nodiscard]] common::Result<WorkspaceLease> acquire() const;

  [[nodiscard]] std::filesystem::path root() const;

private:
  std::filesystem::path root_;
  std::string script_filename_;
};

} // namespace toolexec::sandbox
