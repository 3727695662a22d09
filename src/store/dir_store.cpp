#include "toolexec/store/dir_store.hpp"

#include "toolexec/common/fs.hpp"

namespace toolexec::store {

DirectoryCodeStore::DirectoryCodeStore(std::filesystem::path root) : root_(std::move(root)) {}

common::Result<std::optional<CodeRecord>> DirectoryCodeStore::fetch(const std::string &id) {
  using FetchResult = common::Result<std::optional<CodeRecord>>;
  if (!is_plain_identifier(id)) {
    return FetchResult::success(std::nullopt);
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    return FetchResult::failure("code directory does not exist: " + root_.string());
  }

  const auto path = root_ / (id + ".py");
  if (!std::filesystem::is_regular_file(path, ec)) {
    return FetchResult::success(std::nullopt);
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    return content.forward_error<std::optional<CodeRecord>>();
  }
  if (content.value().empty()) {
    return FetchResult::success(std::nullopt);
  }
  return FetchResult::success(CodeRecord{.id = id, .source_text = std::move(content.value())});
}

} // namespace toolexec::store
