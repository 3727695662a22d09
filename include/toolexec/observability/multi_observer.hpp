#pragma once

#include "toolexec/observability/observer.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace toolexec::observability {

/// Fans every execution event and metric out to each attached sink, in attach order.
class MultiObserver final : public IObserver {
public:
  void attach(std::unique_ptr<IObserver> sink);
  [[nodiscard]] std::size_t sink_count() const { return sinks_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> sinks_;
};

} // namespace toolexec::observability
