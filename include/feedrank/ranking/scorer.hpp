#pragma once

#include "feedrank/ranking/action_model.hpp"
#include "feedrank/ranking/preferences.hpp"
#include "feedrank/ranking/types.hpp"

#include <memory>
#include <vector>

namespace feedrank::ranking {

/// Mean preference weight over the post's topics. News and other count 0.1; a post with
/// no topics is neutral (0.5).
[[nodiscard]] double topic_boost(const std::vector<store::Topic> &topics,
                                 const AlgorithmPreferences &preferences);

[[nodiscard]] double recency_boost(double created_at, double now);

/// 1 + 0.5 * (1 - friends_vs_global) for in-network candidates, 1 otherwise.
[[nodiscard]] double in_network_multiplier(CandidateSource source,
                                           const AlgorithmPreferences &preferences);

/// Multi-action weighted scorer. Output preserves input order; ranks are left at 0 for
/// the diversity pass to assign.
class WeightedScorer {
public:
  explicit WeightedScorer(std::shared_ptr<const IActionModel> model = nullptr);

  [[nodiscard]] std::vector<ScoredCandidate> score(const std::vector<Candidate> &candidates,
                                                   const AlgorithmPreferences &preferences,
                                                   double now) const;
  [[nodiscard]] ScoredCandidate score_one(const Candidate &candidate,
                                          const AlgorithmPreferences &preferences,
                                          double now) const;

  [[nodiscard]] const IActionModel &model() const { return *model_; }

private:
  std::shared_ptr<const IActionModel> model_;
};

} // namespace feedrank::ranking
