#pragma once

#include "toolexec/common/result.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace toolexec::net {

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  // Keys are lowercased.
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct ServerResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

using RequestHandler = std::function<ServerResponse(const HttpRequest &)>;

using ErrorBodyFn = std::function<std::string(const std::string &message)>;

struct ServerOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 0;
  std::size_t max_concurrent_requests = 16;
  std::size_t max_body_bytes = 1024 * 1024;
  // Renders the body of server-generated errors (400, 413, 503).
  ErrorBodyFn error_body;
};

/// Minimal HTTP/1.1 server: one worker thread per admitted connection, one request per
/// connection, at most max_concurrent_requests in flight. Excess connections get 503.
class HttpServer {
public:
  explicit HttpServer(RequestHandler handler);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  [[nodiscard]] common::Status start(const ServerOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const { return bound_port_; }
  [[nodiscard]] bool is_running() const { return running_.load(); }
  [[nodiscard]] std::size_t in_flight() const { return in_flight_.load(); }

  /// Route a parsed request exactly as a live connection would, minus admission.
  [[nodiscard]] ServerResponse dispatch_for_test(const HttpRequest &request) const;

private:
  void accept_loop(int listen_fd);
  void spawn_worker(std::function<void()> work);
  void serve_connection(int client_fd);
  void reject_connection(int client_fd);
  [[nodiscard]] ServerResponse dispatch(const HttpRequest &request) const;
  [[nodiscard]] std::string error_body(const std::string &message) const;

  RequestHandler handler_;
  ServerOptions options_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;

  std::atomic<std::size_t> in_flight_{0};
  std::mutex workers_mutex_;
  std::condition_variable workers_cv_;
  std::size_t active_workers_ = 0;
};

[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string render_http_response(const ServerResponse &response);
[[nodiscard]] std::string status_text(int status);
[[nodiscard]] ServerResponse make_json_response(int status, const std::string &body);
[[nodiscard]] ServerResponse make_text_response(int status, const std::string &body);

/// Permissive CORS headers attached to every response.
void apply_cors_headers(ServerResponse &response);

} // namespace toolexec::net
