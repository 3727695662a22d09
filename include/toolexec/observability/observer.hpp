#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace toolexec::observability {

struct ProbeEvent {
  std::string url;
  bool healthy = false;
  std::string detail;
  std::chrono::milliseconds duration{0};
};

struct CodeLookupEvent {
  std::string code_id;
  std::string backend;
  bool found = false;
  // Set when the store could not be reached or answered garbage.
  std::string error;
};

struct ExecutionAttemptEvent {
  std::string tier;
  std::string code_id;
  std::string code_digest;
  bool success = false;
  std::string error_kind;
  std::chrono::milliseconds duration{0};
};

struct CleanupFailureEvent {
  std::string path;
  std::string message;
};

struct ServerRequestEvent {
  std::string method;
  std::string path;
  int status = 0;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ProbeEvent, CodeLookupEvent, ExecutionAttemptEvent,
                                   CleanupFailureEvent, ServerRequestEvent, ErrorEvent>;

struct ExecutionLatencyMetric {
  std::string tier;
  std::chrono::milliseconds latency{0};
};

struct InFlightRequestsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ExecutionLatencyMetric, InFlightRequestsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace toolexec::observability
