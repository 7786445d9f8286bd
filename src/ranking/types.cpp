#include "feedrank/ranking/types.hpp"

namespace feedrank::ranking {

std::string_view source_to_string(const CandidateSource source) {
  switch (source) {
  case CandidateSource::InNetwork:
    return "in_network";
  case CandidateSource::OutOfNetwork:
    return "out_of_network";
  }
  return "unknown";
}

double pre_diversity_score(const RankingExplanation &explanation) {
  double weighted = 0.0;
  for (const auto &score : explanation.action_scores) {
    weighted += score.contribution;
  }
  const auto &breakdown = explanation.breakdown;
  return breakdown.in_network_multiplier * weighted + breakdown.topic_adjustment +
         breakdown.recency_adjustment;
}

double reconstruct_score(const RankingExplanation &explanation) {
  return pre_diversity_score(explanation) - explanation.breakdown.diversity_reduction;
}

} // namespace feedrank::ranking
