#include "toolexec/store/sqlite_store.hpp"

#include <cctype>

namespace toolexec::store {

namespace {

bool is_sql_identifier(const std::string &name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
    return false;
  }
  for (const char ch : name) {
    if (!(std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

} // namespace

SqliteCodeStore::SqliteCodeStore(sqlite3 *db, std::string table)
    : db_(db), table_(std::move(table)) {}

SqliteCodeStore::~SqliteCodeStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Result<std::unique_ptr<SqliteCodeStore>>
SqliteCodeStore::open(const std::filesystem::path &db_path, const std::string &table) {
  using OpenResult = common::Result<std::unique_ptr<SqliteCodeStore>>;
  if (!is_sql_identifier(table)) {
    return OpenResult::failure("invalid table name: " + table);
  }

  sqlite3 *db = nullptr;
  const int rc = sqlite3_open_v2(db_path.string().c_str(), &db,
                                 SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return OpenResult::failure("unable to open " + db_path.string() + ": " + msg);
  }
  sqlite3_busy_timeout(db, 2000);
  return OpenResult::success(std::unique_ptr<SqliteCodeStore>(new SqliteCodeStore(db, table)));
}

common::Result<std::optional<CodeRecord>> SqliteCodeStore::fetch(const std::string &id) {
  using FetchResult = common::Result<std::optional<CodeRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);

  const std::string sql = "SELECT code FROM \"" + table_ + "\" WHERE id = ?1 LIMIT 1";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return FetchResult::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    const int bytes = sqlite3_column_bytes(stmt, 0);
    std::string code = text == nullptr ? "" : std::string(text, static_cast<std::size_t>(bytes));
    sqlite3_finalize(stmt);
    if (code.empty()) {
      return FetchResult::success(std::nullopt);
    }
    return FetchResult::success(CodeRecord{.id = id, .source_text = std::move(code)});
  }

  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return FetchResult::failure(sqlite3_errmsg(db_));
  }
  return FetchResult::success(std::nullopt);
}

} // namespace toolexec::store
