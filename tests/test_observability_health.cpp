#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "toolexec/common/json_util.hpp"
#include "toolexec/health/health.hpp"
#include "toolexec/observability/factory.hpp"
#include "toolexec/observability/global.hpp"
#include "toolexec/observability/log_observer.hpp"
#include "toolexec/observability/multi_observer.hpp"
#include "toolexec/observability/noop_observer.hpp"

#include <memory>

void register_observability_health_tests(std::vector<toolexec::tests::TestCase> &tests) {
  using toolexec::tests::require;
  namespace obs = toolexec::observability;
  namespace health = toolexec::health;

  tests.push_back({"observer_factory_selects_backend", [] {
                     toolexec::config::Config config;
                     config.observability.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none is noop");
                     config.observability.backend = " LOG ";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "prometheus";
                     require(obs::create_observer(config)->name() == "log",
                             "unknown falls back to log");
                   }});

  tests.push_back({"observer_factory_builds_multi_from_list", [] {
                     toolexec::config::Config config;
                     config.observability.backend = "log, none,";
                     auto observer = obs::create_observer(config);
                     require(observer->name() == "multi", "comma list is multi");
                     const auto *multi = dynamic_cast<obs::MultiObserver *>(observer.get());
                     require(multi != nullptr && multi->sink_count() == 2, "two sinks, blank skipped");
                   }});

  tests.push_back({"multi_observer_fans_out_to_every_sink", [] {
                     auto first = std::make_unique<toolexec::testing::CountingObserver>();
                     auto second = std::make_unique<toolexec::testing::CountingObserver>();
                     auto *first_view = first.get();
                     auto *second_view = second.get();
                     obs::MultiObserver multi;
                     multi.attach(std::move(first));
                     multi.attach(nullptr);
                     multi.attach(std::move(second));
                     require(multi.sink_count() == 2, "null sink ignored");

                     multi.record_event(obs::CleanupFailureEvent{.path = "/tmp/x", .message = "busy"});
                     multi.record_metric(obs::InFlightRequestsMetric{.count = 3});
                     require(first_view->cleanup_failures() == 1 && second_view->cleanup_failures() == 1,
                             "event reached both");
                     require(first_view->metrics() == 1 && second_view->metrics() == 1,
                             "metric reached both");
                   }});

  tests.push_back({"global_observer_receives_attempt_and_latency", [] {
                     toolexec::testing::ObserverScope scope;
                     obs::record_execution_attempt(obs::ExecutionAttemptEvent{
                         .tier = "resident",
                         .code_id = "abc123",
                         .code_digest = "",
                         .success = true,
                         .error_kind = "",
                         .duration = std::chrono::milliseconds(12),
                     });
                     obs::record_probe("http://127.0.0.1:3500", false, "refused",
                                       std::chrono::milliseconds(1));
                     require(scope.observer().attempts().size() == 1, "one attempt");
                     require(scope.observer().attempts()[0].code_id == "abc123", "attempt id");
                     require(scope.observer().probes() == 1, "one probe");
                     require(scope.observer().metrics() == 1, "latency metric emitted");
                   }});

  tests.push_back({"recording_without_observer_is_harmless", [] {
                     obs::set_global_observer(nullptr);
                     obs::record_error("test", "nobody listening");
                     obs::record_in_flight(3);
                     require(obs::get_global_observer() == nullptr, "still unset");
                   }});

  tests.push_back({"log_observer_accepts_every_event", [] {
                     obs::LogObserver log;
                     log.record_event(obs::CleanupFailureEvent{.path = "/tmp/x", .message = "busy"});
                     log.record_event(obs::CodeLookupEvent{
                         .code_id = "a", .backend = "rest", .found = false, .error = "HTTP 500"});
                     log.record_event(obs::ServerRequestEvent{.method = "POST",
                                                              .path = "/execute",
                                                              .status = 200,
                                                              .duration = std::chrono::milliseconds(3)});
                     log.record_metric(obs::ExecutionLatencyMetric{
                         .tier = "local", .latency = std::chrono::milliseconds(5)});
                     log.flush();
                   }});

  tests.push_back({"health_tracks_component_states", [] {
                     health::clear();
                     health::mark_component_starting("server");
                     require(health::get_component("server")->status == "starting", "starting");
                     health::mark_component_ok("server");
                     const auto ok = health::get_component("server");
                     require(ok->status == "ok" && ok->last_ok.has_value(), "ok with timestamp");
                     require(health::overall_status() == "healthy", "healthy overall");

                     health::mark_component_error("interpreter", "not found");
                     require(health::overall_status() == "degraded", "error degrades");
                     require(health::get_component("interpreter")->last_error == "not found",
                             "error kept");
                     require(!health::get_component("missing").has_value(), "unknown component");
                     health::clear();
                     require(health::snapshot().components.empty(), "cleared");
                   }});

  tests.push_back({"health_report_is_json", [] {
                     health::clear();
                     health::mark_component_ok("workspace");
                     const auto report = health::report_json("resident");
                     const auto fields = toolexec::common::json_object_fields(report);
                     require(fields.ok(), fields.error());
                     require(toolexec::common::json_field_string(fields.value(), "status") ==
                                 "healthy",
                             "status field");
                     require(toolexec::common::json_field_string(fields.value(), "service") ==
                                 "resident",
                             "service field");
                     const auto components =
                         toolexec::common::json_object_fields(fields.value().at("components"));
                     require(components.ok() && components.value().contains("workspace"),
                             "components listed");
                     health::clear();
                   }});
}
