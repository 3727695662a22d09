#pragma once

#include "toolexec/config/schema.hpp"
#include "toolexec/observability/observer.hpp"

#include <memory>

namespace toolexec::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace toolexec::observability
