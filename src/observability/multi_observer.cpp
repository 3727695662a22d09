#include "toolexec/observability/multi_observer.hpp"

namespace toolexec::observability {

void MultiObserver::attach(std::unique_ptr<IObserver> sink) {
  if (sink == nullptr) {
    return;
  }
  sinks_.push_back(std::move(sink));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &sink : sinks_) {
    sink->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &sink : sinks_) {
    sink->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &sink : sinks_) {
    sink->flush();
  }
}

} // namespace toolexec::observability
