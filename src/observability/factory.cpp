#include "toolexec/observability/factory.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/observability/log_observer.hpp"
#include "toolexec/observability/multi_observer.hpp"
#include "toolexec/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>

namespace toolexec::observability {

namespace {

std::unique_ptr<IObserver> make_sink(const std::string &token) {
  if (token == "none" || token == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (!token.empty() && token != "log") {
    std::cerr << "[WARN] unknown observability backend '" << token << "', using log\n";
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return make_sink(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream list(backend);
  std::string token;
  while (std::getline(list, token, ',')) {
    token = common::trim(token);
    if (!token.empty()) {
      multi->attach(make_sink(token));
    }
  }
  return multi;
}

} // namespace toolexec::observability
