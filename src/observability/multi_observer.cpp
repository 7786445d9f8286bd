#include "feedrank/observability/multi_observer.hpp"

namespace feedrank::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  // No-op children would only cost a virtual call per event.
  if (observer == nullptr || observer->name() == "noop") {
    return;
  }
  observers_.push_back(std::move(observer));
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace feedrank::observability
