#include "feedrank/observability/factory.hpp"

#include "feedrank/common/fs.hpp"
#include "feedrank/observability/log_observer.hpp"
#include "feedrank/observability/multi_observer.hpp"
#include "feedrank/observability/noop_observer.hpp"

#include <iostream>
#include <vector>

namespace feedrank::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = common::split(common::to_lower(config.observability.backend), ',');

  std::vector<std::unique_ptr<IObserver>> observers;
  bool any_known = false;
  for (const auto &name : names) {
    if (name == "none" || name == "noop") {
      any_known = true;
    } else if (name == "log") {
      any_known = true;
      observers.push_back(std::make_unique<LogObserver>());
    } else {
      std::cerr << "[WARN] unknown observability backend '" << name << "' ignored\n";
    }
  }

  // Only unknown names: keep logging rather than going silent.
  if (!any_known && !names.empty()) {
    std::cerr << "[WARN] no usable observability backend in '" << config.observability.backend
              << "', using log\n";
    return std::make_unique<LogObserver>();
  }
  if (observers.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (observers.size() == 1) {
    return std::move(observers.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (auto &observer : observers) {
    multi->add(std::move(observer));
  }
  return multi;
}

} // namespace feedrank::observability
