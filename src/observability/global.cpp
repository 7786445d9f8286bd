#include "feedrank/observability/global.hpp"

#include <mutex>

namespace feedrank::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_feed_request(const std::string &user_id, const std::size_t limit,
                         const bool following_only) {
  record_event(FeedRequestEvent{
      .user_id = user_id, .limit = limit, .following_only = following_only});
}

void record_stage(const std::string &stage, const std::size_t candidates) {
  record_event(PipelineStageEvent{.stage = stage, .candidates = candidates});
}

void record_feed_served(const std::string &user_id, const std::size_t items,
                        const std::chrono::milliseconds duration) {
  record_event(FeedServedEvent{.user_id = user_id, .items = items, .duration = duration});
  record_metric(RankingLatencyMetric{.latency = duration});
}

void record_external_fetch(const std::string &source, const std::size_t items,
                           const bool success) {
  record_event(ExternalFetchEvent{.source = source, .items = items, .success = success});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace feedrank::observability
