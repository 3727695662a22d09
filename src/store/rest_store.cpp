#include "toolexec/store/rest_store.hpp"

#include "toolexec/common/json_util.hpp"

namespace toolexec::store {

RestCodeStore::RestCodeStore(std::string base_url, std::string api_key, std::string table,
                             std::shared_ptr<net::HttpClient> http_client,
                             const std::uint64_t timeout_ms)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)), table_(std::move(table)),
      http_client_(std::move(http_client)), timeout_ms_(timeout_ms) {}

std::string RestCodeStore::query_url(const std::string &id) const {
  return net::join_url(base_url_, "/rest/v1/" + net::url_encode(table_)) +
         "?id=eq." + net::url_encode(id) + "&select=id,code";
}

common::Result<std::optional<CodeRecord>> RestCodeStore::fetch(const std::string &id) {
  using FetchResult = common::Result<std::optional<CodeRecord>>;
  if (base_url_.empty()) {
    return FetchResult::failure("code store URL is not configured");
  }

  net::HeaderMap headers{{"Accept", "application/json"}};
  if (!api_key_.empty()) {
    headers["apikey"] = api_key_;
    headers["Authorization"] = "Bearer " + api_key_;
  }

  const auto response = http_client_->get(query_url(id), headers, timeout_ms_);
  if (response.network_error) {
    return FetchResult::failure("code store unreachable: " + response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return FetchResult::failure("code store returned HTTP " + std::to_string(response.status));
  }

  const auto rows = common::json_array_elements(response.body);
  if (!rows.ok()) {
    return FetchResult::failure("code store returned malformed JSON: " + rows.error());
  }
  if (rows.value().empty()) {
    return FetchResult::success(std::nullopt);
  }

  const auto fields = common::json_object_fields(rows.value().front());
  if (!fields.ok()) {
    return FetchResult::failure("code store row is not an object");
  }
  const auto code = common::json_field_string(fields.value(), "code");
  if (!code.has_value() || code->empty()) {
    return FetchResult::success(std::nullopt);
  }
  return FetchResult::success(CodeRecord{.id = id, .source_text = *code});
}

} // namespace toolexec::store
