#include "toolexec/store/factory.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/store/dir_store.hpp"
#include "toolexec/store/rest_store.hpp"
#include "toolexec/store/sqlite_store.hpp"

namespace toolexec::store {

common::Result<std::unique_ptr<ICodeStore>>
create_code_store(const config::Config &config, std::shared_ptr<net::HttpClient> http_client) {
  using StoreResult = common::Result<std::unique_ptr<ICodeStore>>;
  const auto &store = config.code_store;
  const std::string backend = common::to_lower(common::trim(store.backend));

  if (backend == "rest") {
    if (store.url.empty()) {
      return StoreResult::failure("code_store.url is not set");
    }
    return StoreResult::success(std::make_unique<RestCodeStore>(
        store.url, store.api_key, store.table, std::move(http_client),
        config.http.request_timeout_ms));
  }
  if (backend == "sqlite") {
    auto opened = SqliteCodeStore::open(common::expand_path(store.path), store.table);
    if (!opened.ok()) {
      return opened.forward_error<std::unique_ptr<ICodeStore>>();
    }
    return StoreResult::success(std::move(opened.value()));
  }
  if (backend == "dir") {
    return StoreResult::success(
        std::make_unique<DirectoryCodeStore>(common::expand_path(store.path)));
  }
  return StoreResult::failure("unknown code_store.backend: " + store.backend);
}

} // namespace toolexec::store
