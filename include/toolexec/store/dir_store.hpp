#pragma once

#include "toolexec/store/code_store.hpp"

#include <filesystem>

namespace toolexec::store {

/// One script per file: <root>/<id>.py.
class DirectoryCodeStore final : public ICodeStore {
public:
  explicit DirectoryCodeStore(std::filesystem::path root);

  [[nodiscard]] common::Result<std::optional<CodeRecord>> fetch(const std::string &id) override;
  [[nodiscard]] std::string_view name() const override { return "dir"; }

private:
  std::filesystem::path root_;
};

} // namespace toolexec::store
