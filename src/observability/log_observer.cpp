#include "toolexec/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace toolexec::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::string line;
  line.reserve(message.size() + level.size() + 4);
  line.append("[").append(level).append("] ").append(message).append("\n");
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << line;
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ProbeEvent>) {
          log_line(evt.healthy ? "DEBUG" : "WARN",
                   "probe url=" + evt.url + " healthy=" + bool_text(evt.healthy) +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       (evt.detail.empty() ? "" : " detail=" + evt.detail));
        } else if constexpr (std::is_same_v<T, CodeLookupEvent>) {
          log_line(evt.error.empty() ? "DEBUG" : "WARN",
                   "code.lookup id=" + evt.code_id + " backend=" + evt.backend +
                       " found=" + bool_text(evt.found) +
                       (evt.error.empty() ? "" : " error=" + evt.error));
        } else if constexpr (std::is_same_v<T, ExecutionAttemptEvent>) {
          std::string message = "execution.attempt tier=" + evt.tier + " id=" + evt.code_id +
                                " success=" + bool_text(evt.success) +
                                " duration_ms=" + std::to_string(evt.duration.count());
          if (!evt.code_digest.empty()) {
            message += " sha256=" + evt.code_digest.substr(0, 12);
          }
          if (!evt.error_kind.empty()) {
            message += " kind=" + evt.error_kind;
          }
          log_line("INFO", message);
        } else if constexpr (std::is_same_v<T, CleanupFailureEvent>) {
          log_line("ERROR", "workspace.cleanup path=" + evt.path + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ServerRequestEvent>) {
          log_line("INFO", "http " + evt.method + " " + evt.path + " -> " +
                               std::to_string(evt.status) + " (" +
                               std::to_string(evt.duration.count()) + "ms)");
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          log_line("DEBUG", "metric.execution_latency_ms{tier=" + m.tier +
                                "}=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, InFlightRequestsMetric>) {
          log_line("DEBUG", "metric.in_flight_requests=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace toolexec::observability
