#pragma once

#include "notegraph/config/schema.hpp"
#include "notegraph/observability/observer.hpp"

#include <memory>

namespace notegraph::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace notegraph::observability
