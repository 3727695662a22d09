#include "tests/helpers/test_helpers.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/observability/global.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <memory>
#include <fstream>
#include <random>

namespace toolexec::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("toolexec-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::size_t TempWorkspace::entry_count() const {
  std::size_t count = 0;
  std::error_code ec;
  for (auto it = std::filesystem::directory_iterator(path_, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    ++count;
  }
  return count;
}

config::ExecutionConfig shell_execution(const TempWorkspace &workspace,
                                        const std::uint64_t timeout_ms) {
  config::ExecutionConfig execution;
  execution.interpreter = "/bin/sh";
  execution.script_filename = "function.sh";
  execution.workspace_root = workspace.path().string();
  execution.timeout_ms = timeout_ms;
  return execution;
}

config::Config mock_config(const TempWorkspace &workspace) {
  config::Config config;
  config.execution = shell_execution(workspace);
  config.resident.url = "http://resident.test";
  config.ondemand.url = "http://ondemand.test";
  config.code_store.backend = "dir";
  config.code_store.path = (workspace.path() / "code").string();
  config.observability.backend = "none";
  return config;
}

net::HttpResponse json_response(const std::uint16_t status, std::string body) {
  net::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  response.headers["content-type"] = "application/json";
  return response;
}

void MockHttpClient::set_response(const std::string &url_suffix, net::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  responses_.emplace_back(url_suffix, std::move(response));
}

void MockHttpClient::set_network_error(const std::string &url_suffix, std::string message) {
  net::HttpResponse response;
  response.network_error = true;
  response.network_error_message = std::move(message);
  set_response(url_suffix, std::move(response));
}

net::HttpResponse MockHttpClient::respond(RecordedCall call) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string url = call.url;
  calls_.push_back(std::move(call));
  // Latest registration wins.
  for (auto it = responses_.rbegin(); it != responses_.rend(); ++it) {
    if (common::ends_with(url, it->first)) {
      return it->second;
    }
  }
  net::HttpResponse missing;
  missing.network_error = true;
  missing.network_error_message = "Could not connect to server";
  return missing;
}

net::HttpResponse MockHttpClient::get(const std::string &url, const net::HeaderMap &headers,
                                      const std::uint64_t timeout_ms) {
  return respond(RecordedCall{
      .method = "GET", .url = url, .headers = headers, .body = "", .timeout_ms = timeout_ms});
}

net::HttpResponse MockHttpClient::post_json(const std::string &url, const net::HeaderMap &headers,
                                            const std::string &body,
                                            const std::uint64_t timeout_ms) {
  return respond(RecordedCall{
      .method = "POST", .url = url, .headers = headers, .body = body, .timeout_ms = timeout_ms});
}

std::vector<RecordedCall> MockHttpClient::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

std::size_t MockHttpClient::count_calls(const std::string &url_suffix) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &call : calls_) {
    if (common::ends_with(call.url, url_suffix)) {
      ++count;
    }
  }
  return count;
}

void LoopbackHttpClient::mount(const std::string &base_url, net::RequestHandler handler) {
  mounts_.emplace_back(base_url, std::move(handler));
}

net::HttpResponse LoopbackHttpClient::route(const std::string &method, const std::string &url,
                                            const std::string &body) {
  for (const auto &[base, handler] : mounts_) {
    if (!common::starts_with(url, base)) {
      continue;
    }
    net::HttpRequest request;
    request.method = method;
    request.raw_path = url.substr(base.size());
    request.path = request.raw_path.substr(0, request.raw_path.find('?'));
    request.body = body;
    const auto served = handler(request);
    net::HttpResponse response;
    response.status = static_cast<std::uint16_t>(served.status);
    response.body = served.body;
    response.headers["content-type"] = served.content_type;
    return response;
  }
  net::HttpResponse refused;
  refused.network_error = true;
  refused.network_error_message = "Connection refused";
  return refused;
}

net::HttpResponse LoopbackHttpClient::get(const std::string &url, const net::HeaderMap &,
                                          std::uint64_t) {
  return route("GET", url, "");
}

net::HttpResponse LoopbackHttpClient::post_json(const std::string &url, const net::HeaderMap &,
                                                const std::string &body, std::uint64_t) {
  return route("POST", url, body);
}

void FakeCodeStore::put(const std::string &id, std::string source_text) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[id] = std::move(source_text);
}

void FakeCodeStore::fail_with(std::string message) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_ = std::move(message);
}

common::Result<std::optional<store::CodeRecord>> FakeCodeStore::fetch(const std::string &id) {
  using FetchResult = common::Result<std::optional<store::CodeRecord>>;
  ++fetches_;
  std::lock_guard<std::mutex> lock(mutex_);
  if (failure_.has_value()) {
    return FetchResult::failure(*failure_);
  }
  const auto it = records_.find(id);
  if (it == records_.end() || it->second.empty()) {
    return FetchResult::success(std::nullopt);
  }
  return FetchResult::success(store::CodeRecord{.id = id, .source_text = it->second});
}

void CountingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CountingObserver::record_metric(const observability::ObserverMetric &) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++metrics_;
}

std::vector<observability::ExecutionAttemptEvent> CountingObserver::attempts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<observability::ExecutionAttemptEvent> out;
  for (const auto &event : events_) {
    if (const auto *attempt = std::get_if<observability::ExecutionAttemptEvent>(&event)) {
      out.push_back(*attempt);
    }
  }
  return out;
}

std::size_t CountingObserver::probes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &event : events_) {
    count += std::holds_alternative<observability::ProbeEvent>(event) ? 1 : 0;
  }
  return count;
}

std::size_t CountingObserver::cleanup_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &event : events_) {
    count += std::holds_alternative<observability::CleanupFailureEvent>(event) ? 1 : 0;
  }
  return count;
}

std::size_t CountingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

std::size_t CountingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ObserverScope::ObserverScope() {
  auto observer = std::make_unique<CountingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverScope::~ObserverScope() { observability::set_global_observer(nullptr); }

std::string raw_http_exchange(const std::uint16_t port, const std::string &request) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return "";
  }
  timeval tv{};
  tv.tv_sec = 15;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    close(fd);
    return "";
  }

  std::size_t sent = 0;
  while (sent < request.size()) {
    const ssize_t n = send(fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      break;
    }
    sent += static_cast<std::size_t>(n);
  }

  std::string response;
  std::array<char, 4096> buf{};
  while (true) {
    const ssize_t n = recv(fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    response.append(buf.data(), static_cast<std::size_t>(n));
  }
  close(fd);
  return response;
}

int connect_idle(const std::uint16_t port) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    close(fd);
    return -1;
  }
  return fd;
}

int raw_status(const std::string &response) {
  const auto space = response.find(' ');
  if (!common::starts_with(response, "HTTP/1.1 ") || space == std::string::npos ||
      response.size() < space + 4) {
    return 0;
  }
  int status = 0;
  for (std::size_t i = space + 1; i < space + 4; ++i) {
    if (response[i] < '0' || response[i] > '9') {
      return 0;
    }
    status = status * 10 + (response[i] - '0');
  }
  return status;
}

std::string raw_body(const std::string &response) {
  const auto split = response.find("\r\n\r\n");
  return split == std::string::npos ? "" : response.substr(split + 4);
}

net::HttpRequest make_request(std::string method, std::string path, std::string body) {
  net::HttpRequest request;
  request.method = std::move(method);
  request.raw_path = path;
  request.path = std::move(path);
  request.body = std::move(body);
  return request;
}

} // namespace toolexec::testing
