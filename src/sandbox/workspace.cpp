#include "toolexec/sandbox/workspace.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/observability/global.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>

namespace toolexec::sandbox {

namespace {

constexpr int kMaxCreateAttempts = 8;
constexpr const char *kWorkspacePrefix = "toolexec-run-";

} // namespace

WorkspaceLease::WorkspaceLease(std::filesystem::path directory, std::string script_filename)
    : directory_(std::move(directory)), script_filename_(std::move(script_filename)) {}

WorkspaceLease WorkspaceLease::adopt(std::filesystem::path directory,
                                     std::string script_filename) {
  return WorkspaceLease(std::move(directory), std::move(script_filename));
}

WorkspaceLease::WorkspaceLease(WorkspaceLease &&other) noexcept
    : directory_(std::move(other.directory_)),
      script_filename_(std::move(other.script_filename_)) {
  other.directory_.clear();
}

WorkspaceLease &WorkspaceLease::operator=(WorkspaceLease &&other) noexcept {
  if (this != &other) {
    release();
    directory_ = std::move(other.directory_);
    script_filename_ = std::move(other.script_filename_);
    other.directory_.clear();
  }
  return *this;
}

WorkspaceLease::~WorkspaceLease() { release(); }

common::Status WorkspaceLease::write(const std::string &source_text) const {
  if (!active()) {
    return common::Status::error("workspace already released");
  }
  const auto path = script_path();
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to create script file: " + path.string());
  }
  file.write(source_text.data(), static_cast<std::streamsize>(source_text.size()));
  file.close();
  if (!file) {
    return common::Status::error("Unable to write script file: " + path.string());
  }
  return common::Status::success();
}

void WorkspaceLease::release() noexcept {
  if (directory_.empty()) {
    return;
  }
  const std::filesystem::path directory = std::move(directory_);
  directory_.clear();

  try {
    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
    if (ec) {
      observability::record_cleanup_failure(directory.string(), ec.message());
    }
  } catch (const std::exception &ex) {
    // remove_all(ec) may still throw bad_alloc.
    observability::record_cleanup_failure(directory.string(), ex.what());
  }
}

WorkspaceManager::WorkspaceManager(std::filesystem::path root, std::string script_filename)
    : root_(std::move(root)), script_filename_(std::move(script_filename)) {}

std::filesystem::path WorkspaceManager::root() const {
  if (!root_.empty()) {
    return root_;
  }
  std::error_code ec;
  auto temp = std::filesystem::temp_directory_path(ec);
  return ec ? std::filesystem::path("/tmp") : temp;
}

common::Result<WorkspaceLease> WorkspaceManager::acquire() const {
  const auto base = root();
  std::error_code ec;
  std::filesystem::create_directories(base, ec);
  if (ec) {
    return common::Result<WorkspaceLease>::failure("Unable to create workspace root " +
                                                   base.string() + ": " + ec.message());
  }

  for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
    const auto candidate = base / (kWorkspacePrefix + common::random_hex(8));
    if (::mkdir(candidate.c_str(), 0700) == 0) {
      return common::Result<WorkspaceLease>::success(
          WorkspaceLease::adopt(candidate, script_filename_));
    }
    if (errno != EEXIST) {
      return common::Result<WorkspaceLease>::failure("Unable to create workspace " +
                                                     candidate.string() + ": " +
                                                     std::strerror(errno));
    }
  }
  return common::Result<WorkspaceLease>::failure("Unable to allocate a unique workspace under " +
                                                 base.string());
}

} // namespace toolexec::sandbox
