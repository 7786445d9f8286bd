#pragma once

#include "feedrank/observability/observer.hpp"

#include <memory>
#include <vector>

namespace feedrank::observability {

/// Fans every event and metric out to its children in insertion order.
class MultiObserver final : public IObserver {
public:
  /// Null and no-op observers are dropped.
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace feedrank::observability
