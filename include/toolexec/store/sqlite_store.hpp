#pragma once

#include "toolexec/store/code_store.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <memory>
#include <mutex>

namespace toolexec::store {

/// Read-only lookups against a SQLite table with `id` and `code` text columns.
class SqliteCodeStore final : public ICodeStore {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteCodeStore>>
  open(const std::filesystem::path &db_path, const std::string &table);
  ~SqliteCodeStore() override;

  SqliteCodeStore(const SqliteCodeStore &) = delete;
  SqliteCodeStore &operator=(const SqliteCodeStore &) = delete;

  [[nodiscard]] common::Result<std::optional<CodeRecord>> fetch(const std::string &id) override;
  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

private:
  SqliteCodeStore(sqlite3 *db, std::string table);

  sqlite3 *db_ = nullptr;
  std::string table_;
  std::mutex mutex_;
};

} // namespace toolexec::store
