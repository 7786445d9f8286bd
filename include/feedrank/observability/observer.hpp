#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace feedrank::observability {

struct FeedRequestEvent {
  std::string user_id;
  std::size_t limit = 0;
  bool following_only = false;
};

struct PipelineStageEvent {
  std::string stage;
  std::size_t candidates = 0;
};

struct FeedServedEvent {
  std::string user_id;
  std::size_t items = 0;
  std::chrono::milliseconds duration{0};
};

struct ExternalFetchEvent {
  std::string source;
  std::size_t items = 0;
  bool success = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<FeedRequestEvent, PipelineStageEvent, FeedServedEvent,
                                   ExternalFetchEvent, ErrorEvent>;

struct RankingLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct CandidatePoolMetric {
  std::size_t in_network = 0;
  std::size_t out_of_network = 0;
  std::size_t external = 0;
};

using ObserverMetric = std::variant<RankingLatencyMetric, CandidatePoolMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace feedrank::observability
