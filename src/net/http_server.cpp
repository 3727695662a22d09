#include "toolexec/net/http_server.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/common/json_util.hpp"
#include "toolexec/observability/global.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <exception>
#include <sstream>

namespace toolexec::net {

namespace {

constexpr int kListenBacklog = 64;
constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
constexpr int kClientReadTimeoutSecs = 10;
constexpr int kRejectReadTimeoutMs = 500;

enum class ReadStatus { Ok, Malformed, TooLarge, Closed };

struct ReadOutcome {
  ReadStatus status = ReadStatus::Closed;
  HttpRequest request;
};

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[part] = "";
      continue;
    }
    out[part.substr(0, eq)] = part.substr(eq + 1);
  }
  return out;
}

void send_all(const int fd, const std::string &data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return;
    }
    sent += static_cast<std::size_t>(n);
  }
}

void set_read_timeout(const int fd, const int timeout_ms) {
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

ReadOutcome read_request(const int fd, const std::size_t max_body) {
  ReadOutcome outcome;
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t header_end = std::string::npos;
  std::size_t content_length = 0;
  while (true) {
    if (header_end != std::string::npos && raw.size() >= header_end + 4 + content_length) {
      break;
    }
    const ssize_t n = recv(fd, buf.data(), buf.size(), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      if (header_end == std::string::npos) {
        outcome.status = raw.empty() ? ReadStatus::Closed : ReadStatus::Malformed;
        return outcome;
      }
      // Short body: parse what arrived.
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    if (header_end == std::string::npos) {
      header_end = raw.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        if (raw.size() > kMaxHeaderBytes) {
          outcome.status = ReadStatus::Malformed;
          return outcome;
        }
        continue;
      }
      auto head = parse_http_request(raw.substr(0, header_end + 4));
      if (!head.ok()) {
        outcome.status = ReadStatus::Malformed;
        return outcome;
      }
      if (const auto it = head.value().headers.find("content-length");
          it != head.value().headers.end()) {
        const std::string &text = it->second;
        const auto [ptr, ec] =
            std::from_chars(text.data(), text.data() + text.size(), content_length);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
          outcome.status = ReadStatus::Malformed;
          return outcome;
        }
      }
      if (content_length > max_body) {
        outcome.status = ReadStatus::TooLarge;
        return outcome;
      }
    }
  }

  auto parsed = parse_http_request(raw.substr(0, header_end + 4 + content_length));
  if (!parsed.ok()) {
    outcome.status = ReadStatus::Malformed;
    return outcome;
  }
  outcome.status = ReadStatus::Ok;
  outcome.request = std::move(parsed.value());
  return outcome;
}

} // namespace

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  default:
    return "OK";
  }
}

ServerResponse make_json_response(const int status, const std::string &body) {
  ServerResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

ServerResponse make_text_response(const int status, const std::string &body) {
  ServerResponse response;
  response.status = status;
  response.content_type = "text/plain";
  response.body = body;
  return response;
}

void apply_cors_headers(ServerResponse &response) {
  response.headers["Access-Control-Allow-Origin"] = "*";
  response.headers["Access-Control-Allow-Headers"] =
      "authorization, x-client-info, apikey, content-type";
  response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
}

std::string render_http_response(const ServerResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure("incomplete request");
  }

  std::istringstream head_stream(raw.substr(0, header_end));
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure("missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version) ||
      !common::starts_with(http_version, "HTTP/")) {
    return common::Result<HttpRequest>::failure("invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = common::to_lower(common::trim(line.substr(0, colon)));
    request.headers[key] = common::trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }

  return common::Result<HttpRequest>::success(std::move(request));
}

HttpServer::HttpServer(RequestHandler handler) : handler_(std::move(handler)) {}

HttpServer::~HttpServer() { stop(); }

common::Status HttpServer::start(const ServerOptions &options) {
  if (running_) {
    return common::Status::error("server already running");
  }
  if (options.max_concurrent_requests == 0) {
    return common::Status::error("max_concurrent_requests must be greater than 0");
  }
  options_ = options;

  const std::string host = options.host == "localhost" ? "127.0.0.1" : options.host;
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    return common::Status::error("invalid bind host: " + options.host);
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&bound), &bound_len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this, fd = listen_fd_]() { accept_loop(fd); });
  return common::Status::success();
}

void HttpServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Wakes accept(); the fd is closed only after the accept thread is gone.
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    close(listen_fd_);
    listen_fd_ = -1;
  }
  // Workers hold `this`; wait for in-flight executions to finish.
  std::unique_lock<std::mutex> lock(workers_mutex_);
  workers_cv_.wait(lock, [this] { return active_workers_ == 0; });
}

std::string HttpServer::error_body(const std::string &message) const {
  if (options_.error_body) {
    return options_.error_body(message);
  }
  return "{\"error\":" + common::json_quote(message) + "}";
}

ServerResponse HttpServer::dispatch(const HttpRequest &request) const {
  ServerResponse response;
  if (request.method == "OPTIONS") {
    response = make_text_response(200, "ok");
  } else {
    response = handler_(request);
  }
  apply_cors_headers(response);
  return response;
}

ServerResponse HttpServer::dispatch_for_test(const HttpRequest &request) const {
  return dispatch(request);
}

void HttpServer::accept_loop(const int listen_fd) {
  while (running_) {
    const int client = accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    std::size_t current = in_flight_.load();
    bool admitted = false;
    while (current < options_.max_concurrent_requests) {
      if (in_flight_.compare_exchange_weak(current, current + 1)) {
        admitted = true;
        break;
      }
    }
    if (!admitted) {
      set_read_timeout(client, kRejectReadTimeoutMs);
      spawn_worker([this, client]() {
        reject_connection(client);
        close(client);
      });
      continue;
    }
    observability::record_in_flight(current + 1);

    set_read_timeout(client, kClientReadTimeoutSecs * 1000);
    spawn_worker([this, client]() {
      serve_connection(client);
      close(client);
      observability::record_in_flight(--in_flight_);
    });
  }
}

void HttpServer::spawn_worker(std::function<void()> work) {
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    ++active_workers_;
  }
  std::thread([this, work = std::move(work)]() {
    work();
    // Notify under the lock: stop() may destroy the server as soon as it sees zero.
    std::lock_guard<std::mutex> lock(workers_mutex_);
    --active_workers_;
    workers_cv_.notify_all();
  }).detach();
}

/// Runs on its own worker so a slow client cannot stall accept().
void HttpServer::reject_connection(const int client_fd) {
  const auto outcome = read_request(client_fd, options_.max_body_bytes);
  if (outcome.status == ReadStatus::Closed) {
    return;
  }
  auto response = make_json_response(503, error_body("Executor at capacity"));
  apply_cors_headers(response);
  send_all(client_fd, render_http_response(response));
  observability::record_server_request(outcome.request.method, outcome.request.path, 503,
                                       std::chrono::milliseconds(0));
}

void HttpServer::serve_connection(const int client_fd) {
  const auto started = std::chrono::steady_clock::now();
  auto outcome = read_request(client_fd, options_.max_body_bytes);

  ServerResponse response;
  switch (outcome.status) {
  case ReadStatus::Closed:
    return;
  case ReadStatus::Malformed:
    response = make_json_response(400, error_body("Malformed HTTP request"));
    apply_cors_headers(response);
    break;
  case ReadStatus::TooLarge:
    response = make_json_response(413, error_body("Request body too large"));
    apply_cors_headers(response);
    break;
  case ReadStatus::Ok:
    try {
      response = dispatch(outcome.request);
    } catch (const std::exception &ex) {
      observability::record_error("http_server", ex.what());
      response = make_json_response(500, error_body(std::string("Internal error: ") + ex.what()));
      apply_cors_headers(response);
    }
    break;
  }

  send_all(client_fd, render_http_response(response));
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_server_request(outcome.request.method, outcome.request.path,
                                       response.status, elapsed);
}

} // namespace toolexec::net
