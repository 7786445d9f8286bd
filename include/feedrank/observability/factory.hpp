#pragma once

#include "feedrank/config/schema.hpp"
#include "feedrank/observability/observer.hpp"

#include <memory>

namespace feedrank::observability {

/// Builds the observer named by `observability.backend`, a comma list of `log`, `none` or
/// `noop`. No-op entries contribute nothing; one remaining backend is returned as is and
/// several are wrapped in a MultiObserver. Unknown names are skipped with a warning on
/// stderr, and a list made only of unknown names falls back to LogObserver.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace feedrank::observability
