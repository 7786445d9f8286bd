#pragma once

#include "feedrank/ranking/actions.hpp"
#include "feedrank/store/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace feedrank::ranking {

enum class CandidateSource {
  InNetwork,
  OutOfNetwork,
};

[[nodiscard]] std::string_view source_to_string(CandidateSource source);

/// Open-ended numeric signals. Keys and meaning are unstable and may change without notice.
using Extensions = std::map<std::string, double>;

/// A post under consideration for one ranking pass. Never cached across requests.
struct Candidate {
  store::Post post;
  // Absent authors are treated as neutral.
  std::optional<store::User> author;
  CandidateSource source = CandidateSource::InNetwork;
  store::EngagementCounts engagement;
  Extensions extensions;
};

struct ActionScore {
  Action action = Action::Like;
  double weight = 0.0;
  double probability = 0.0;
  // weight * probability
  double contribution = 0.0;
};

struct ScoreBreakdown {
  double in_network_multiplier = 1.0;
  // 0.2 * (topic_boost - 0.5)
  double topic_adjustment = 0.0;
  // 0.1 * (recency_boost - 0.5)
  double recency_adjustment = 0.0;
  // pre-diversity score minus the floored diversity score; negative when the floor at
  // zero raised the score.
  double diversity_reduction = 0.0;
  ActionProbabilities probabilities;
  Extensions extensions;
};

struct RankingExplanation {
  std::string post_id;
  double final_score = 0.0;
  // 1-based, reassigned after diversity re-ranking
  std::size_t rank = 0;
  CandidateSource source = CandidateSource::InNetwork;
  std::vector<ActionScore> action_scores;
  // Nominal (n - 1) * diversity_strength * 0.15 for the nth post by an author.
  double diversity_penalty = 0.0;
  double recency_boost = 0.0;
  double topic_boost = 0.0;
  ScoreBreakdown breakdown;
};

/// multiplier * sum(contributions) + topic_adjustment + recency_adjustment, summed in
/// action order. The scorer produces final scores through this function.
[[nodiscard]] double pre_diversity_score(const RankingExplanation &explanation);

/// Rebuilds `final_score` from the explanation alone; equal to it bit for bit.
[[nodiscard]] double reconstruct_score(const RankingExplanation &explanation);

struct ScoredCandidate {
  Candidate candidate;
  double final_score = 0.0;
  RankingExplanation explanation;
};

struct HydratedPost {
  store::Post post;
  std::optional<store::User> author;
};

struct FeedItem {
  HydratedPost post;
  std::optional<RankingExplanation> explanation;
  std::optional<HydratedPost> parent_post;
  std::optional<HydratedPost> quoted_post;
};

struct FeedResponse {
  std::vector<FeedItem> items;
  // Pagination is not supported; always empty.
  std::optional<std::string> next_cursor;
};

} // namespace feedrank::ranking
