#pragma once

#include "warden/config/schema.hpp"
#include "warden/observability/observer.hpp"

#include <memory>

namespace warden::observability {

/// Builds the observer named by `observability.backend`. A comma separated list is
/// de-duplicated; a list naming one backend yields that backend alone, and several
/// yield a MultiObserver. Unknown names are skipped, and a backend made only of
/// unknown names falls back to the log observer.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace warden::observability
