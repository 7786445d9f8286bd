#pragma once

#include "feedrank/observability/observer.hpp"

#include <memory>

namespace feedrank::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_feed_request(const std::string &user_id, std::size_t limit, bool following_only);
void record_stage(const std::string &stage, std::size_t candidates);
void record_feed_served(const std::string &user_id, std::size_t items,
                        std::chrono::milliseconds duration);
void record_external_fetch(const std::string &source, std::size_t items, bool success);
void record_error(const std::string &component, const std::string &message);

} // namespace feedrank::observability
