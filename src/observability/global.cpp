#include "toolexec/observability/global.hpp"

#include <mutex>

namespace toolexec::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_probe(const std::string &url, const bool healthy, const std::string &detail,
                  const std::chrono::milliseconds duration) {
  record_event(ProbeEvent{.url = url, .healthy = healthy, .detail = detail, .duration = duration});
}

void record_code_lookup(const std::string &code_id, const std::string &backend, const bool found,
                        const std::string &error) {
  record_event(
      CodeLookupEvent{.code_id = code_id, .backend = backend, .found = found, .error = error});
}

void record_execution_attempt(ExecutionAttemptEvent event) {
  const auto tier = event.tier;
  const auto duration = event.duration;
  record_event(event);
  record_metric(ExecutionLatencyMetric{.tier = tier, .latency = duration});
}

void record_cleanup_failure(const std::string &path, const std::string &message) {
  record_event(CleanupFailureEvent{.path = path, .message = message});
}

void record_server_request(const std::string &method, const std::string &path, const int status,
                           const std::chrono::milliseconds duration) {
  record_event(
      ServerRequestEvent{.method = method, .path = path, .status = status, .duration = duration});
}

void record_in_flight(const std::uint64_t count) {
  record_metric(InFlightRequestsMetric{.count = count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace toolexec::observability
