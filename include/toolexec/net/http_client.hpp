#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace toolexec::net {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  // Keys are lowercased.
  HeaderMap headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool is_success() const {
    return !network_error && status >= 200 && status < 300;
  }
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HeaderMap &headers,
                                         std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse get(const std::string &url, const HeaderMap &headers,
                                 std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json(const std::string &url, const HeaderMap &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
};

/// Percent-encode a query or path component (RFC 3986 unreserved characters pass through).
[[nodiscard]] std::string url_encode(const std::string &value);

/// Join a base URL and a path without doubling or dropping the slash.
[[nodiscard]] std::string join_url(const std::string &base, const std::string &path);

} // namespace toolexec::net
