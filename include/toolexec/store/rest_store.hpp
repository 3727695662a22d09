#pragma once

#include "toolexec/net/http_client.hpp"
#include "toolexec/store/code_store.hpp"

#include <memory>

namespace toolexec::store {

/// PostgREST table access: GET <url>/rest/v1/<table>?id=eq.<id>&select=id,code.
class RestCodeStore final : public ICodeStore {
public:
  RestCodeStore(std::string base_url, std::string api_key, std::string table,
                std::shared_ptr<net::HttpClient> http_client, std::uint64_t timeout_ms);

  [[nodiscard]] common::Result<std::optional<CodeRecord>> fetch(const std::string &id) override;
  [[nodiscard]] std::string_view name() const override { return "rest"; }

  [[nodiscard]] std::string query_url(const std::string &id) const;

private:
  std::string base_url_;
  std::string api_key_;
  std::string table_;
  std::shared_ptr<net::HttpClient> http_client_;
  std::uint64_t timeout_ms_;
};

} // namespace toolexec::store
