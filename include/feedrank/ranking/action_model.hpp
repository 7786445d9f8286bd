#pragma once

#include "feedrank/ranking/actions.hpp"
#include "feedrank/ranking/preferences.hpp"
#include "feedrank/ranking/types.hpp"

#include <string_view>

namespace feedrank::ranking {

/// Estimates how likely the viewer is to take each action on a candidate. Implementations
/// must be deterministic for a given (candidate, preferences, now).
class IActionModel {
public:
  virtual ~IActionModel() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual ActionProbabilities predict(const Candidate &candidate,
                                                    const AlgorithmPreferences &preferences,
                                                    double now) const = 0;
};

/// 1 / (1 + age_hours); posts from the future count as brand new.
[[nodiscard]] double recency_score(double created_at, double now);

/// min(1, tanh((likes + 2 reposts + 1.5 replies) / 10) * 0.5 + 0.5)
[[nodiscard]] double popularity_score(const store::EngagementCounts &engagement);

/// Engagement-count and age heuristic; no learned parameters.
class HeuristicActionModel final : public IActionModel {
public:
  [[nodiscard]] std::string_view name() const override { return "heuristic"; }
  [[nodiscard]] ActionProbabilities predict(const Candidate &candidate,
                                            const AlgorithmPreferences &preferences,
                                            double now) const override;
};

} // namespace feedrank::ranking
