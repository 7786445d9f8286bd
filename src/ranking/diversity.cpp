#include "feedrank/ranking/diversity.hpp"

#include <algorithm>
#include <unordered_map>

namespace feedrank::ranking {

namespace {

void sort_by_score(std::vector<ScoredCandidate> &scored) {
  std::stable_sort(scored.begin(), scored.end(),
                   [](const ScoredCandidate &lhs, const ScoredCandidate &rhs) {
                     return lhs.final_score > rhs.final_score;
                   });
}

} // namespace

double diversity_penalty(const std::size_t occurrence, const double diversity_strength) {
  if (occurrence <= 1) {
    return 0.0;
  }
  return static_cast<double>(occurrence - 1) * diversity_strength * 0.15;
}

std::vector<ScoredCandidate> apply_author_diversity(std::vector<ScoredCandidate> scored,
                                                    const AlgorithmPreferences &preferences) {
  sort_by_score(scored);

  std::unordered_map<std::string, std::size_t> author_counts;
  for (auto &item : scored) {
    const std::size_t occurrence = ++author_counts[item.candidate.post.author_id];
    const double penalty = diversity_penalty(occurrence, preferences.diversity_strength);
    const double floored = std::max(0.0, item.final_score - penalty);
    // Negative when the floor lifts an already negative score.
    const double reduction = item.final_score - floored;

    item.explanation.diversity_penalty = penalty;
    item.explanation.breakdown.diversity_reduction = reduction;
    item.final_score -= reduction;
    item.explanation.final_score = item.final_score;
  }

  sort_by_score(scored);
  for (std::size_t i = 0; i < scored.size(); ++i) {
    scored[i].explanation.rank = i + 1;
  }
  return scored;
}

} // namespace feedrank::ranking
