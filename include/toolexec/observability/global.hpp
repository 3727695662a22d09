#pragma once

#include "toolexec/observability/observer.hpp"

#include <memory>

namespace toolexec::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_probe(const std::string &url, bool healthy, const std::string &detail,
                  std::chrono::milliseconds duration);
void record_code_lookup(const std::string &code_id, const std::string &backend, bool found,
                        const std::string &error = "");
void record_execution_attempt(ExecutionAttemptEvent event);
void record_cleanup_failure(const std::string &path, const std::string &message);
void record_server_request(const std::string &method, const std::string &path, int status,
                           std::chrono::milliseconds duration);
void record_in_flight(std::uint64_t count);
void record_error(const std::string &component, const std::string &message);

} // namespace toolexec::observability
