#include "feedrank/ranking/scorer.hpp"

namespace feedrank::ranking {

namespace {

double topic_weight(const store::Topic topic, const AlgorithmPreferences &preferences) {
  switch (topic) {
  case store::Topic::Tech:
    return preferences.tech_weight;
  case store::Topic::Politics:
    return preferences.politics_weight;
  case store::Topic::Culture:
    return preferences.culture_weight;
  case store::Topic::Memes:
    return preferences.memes_weight;
  case store::Topic::Finance:
    return preferences.finance_weight;
  case store::Topic::News:
  case store::Topic::Other:
    break;
  }
  return 0.1;
}

} // namespace

double topic_boost(const std::vector<store::Topic> &topics, const AlgorithmPreferences &preferences) {
  if (topics.empty()) {
    return 0.5;
  }
  double total = 0.0;
  for (const auto topic : topics) {
    total += topic_weight(topic, preferences);
  }
  return total / static_cast<double>(topics.size());
}

double recency_boost(const double created_at, const double now) {
  return recency_score(created_at, now);
}

double in_network_multiplier(const CandidateSource source, const AlgorithmPreferences &preferences) {
  if (source != CandidateSource::InNetwork) {
    return 1.0;
  }
  return 1.0 + (1.0 - preferences.friends_vs_global) * 0.5;
}

WeightedScorer::WeightedScorer(std::shared_ptr<const IActionModel> model)
    : model_(model != nullptr ? std::move(model) : std::make_shared<HeuristicActionModel>()) {}

ScoredCandidate WeightedScorer::score_one(const Candidate &candidate,
                                          const AlgorithmPreferences &preferences,
                                          const double now) const {
  const ActionProbabilities probabilities = model_->predict(candidate, preferences, now);

  RankingExplanation explanation;
  explanation.post_id = candidate.post.id;
  explanation.source = candidate.source;
  explanation.topic_boost = topic_boost(candidate.post.topics, preferences);
  explanation.recency_boost = recency_boost(candidate.post.created_at, now);
  explanation.action_scores.reserve(kActionCount);
  for (const auto action : all_actions()) {
    const double weight = action_weight(action);
    const double probability = probabilities.get(action);
    explanation.action_scores.push_back(ActionScore{.action = action,
                                                    .weight = weight,
                                                    .probability = probability,
                                                    .contribution = weight * probability});
  }

  auto &breakdown = explanation.breakdown;
  breakdown.in_network_multiplier = in_network_multiplier(candidate.source, preferences);
  breakdown.topic_adjustment = 0.2 * (explanation.topic_boost - 0.5);
  breakdown.recency_adjustment = 0.1 * (explanation.recency_boost - 0.5);
  breakdown.probabilities = probabilities;

  explanation.final_score = pre_diversity_score(explanation);
  const double final_score = explanation.final_score;
  return ScoredCandidate{
      .candidate = candidate, .final_score = final_score, .explanation = std::move(explanation)};
}

std::vector<ScoredCandidate> WeightedScorer::score(const std::vector<Candidate> &candidates,
                                                   const AlgorithmPreferences &preferences,
                                                   const double now) const {
  std::vector<ScoredCandidate> out;
  out.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    out.push_back(score_one(candidate, preferences, now));
  }
  return out;
}

} // namespace feedrank::ranking
