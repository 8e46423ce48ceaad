#pragma once

#include "chronicle/config/schema.hpp"
#include "chronicle/observability/observer.hpp"

#include <memory>

namespace chronicle::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace chronicle::observability
