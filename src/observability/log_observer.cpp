#include "feedrank/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace feedrank::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  const auto log_line = [this](const std::string &level, const std::string &message) {
    *out_ << "[" << level << "] " << message << "\n";
  };
  std::visit(
      [&log_line](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, FeedRequestEvent>) {
          log_line("INFO", "feed.request user=" + evt.user_id +
                               " limit=" + std::to_string(evt.limit) +
                               " following_only=" + bool_text(evt.following_only));
        } else if constexpr (std::is_same_v<T, PipelineStageEvent>) {
          log_line("DEBUG", "feed.stage name=" + evt.stage +
                                " candidates=" + std::to_string(evt.candidates));
        } else if constexpr (std::is_same_v<T, FeedServedEvent>) {
          log_line("INFO", "feed.served user=" + evt.user_id +
                               " items=" + std::to_string(evt.items) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ExternalFetchEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "external.fetch source=" + evt.source + " items=" +
                       std::to_string(evt.items) + " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RankingLatencyMetric>) {
          *out_ << "[DEBUG] metric.ranking_latency_ms=" << m.latency.count() << "\n";
        } else if constexpr (std::is_same_v<T, CandidatePoolMetric>) {
          *out_ << "[DEBUG] metric.candidate_pool in_network=" << m.in_network
                << " out_of_network=" << m.out_of_network << " external=" << m.external << "\n";
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace feedrank::observability
