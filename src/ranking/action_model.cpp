#include "feedrank/ranking/action_model.hpp"

#include <algorithm>
#include <cmath>

namespace feedrank::ranking {

double recency_score(const double created_at, const double now) {
  const double age_seconds = std::max(0.0, now - created_at);
  return 1.0 / (1.0 + age_seconds / 3600.0);
}

double popularity_score(const store::EngagementCounts &engagement) {
  const double pop = static_cast<double>(engagement.like) * 1.0 +
                     static_cast<double>(engagement.repost) * 2.0 +
                     static_cast<double>(engagement.reply) * 1.5;
  return std::min(1.0, std::tanh(pop / 10.0) * 0.5 + 0.5);
}

ActionProbabilities HeuristicActionModel::predict(const Candidate &candidate,
                                                  const AlgorithmPreferences &preferences,
                                                  const double now) const {
  const auto likes = static_cast<double>(candidate.engagement.like);
  const auto reposts = static_cast<double>(candidate.engagement.repost);

  const double rv = preferences.recency_vs_popularity;
  const double base = (1.0 - rv) * recency_score(candidate.post.created_at, now) +
                      rv * popularity_score(candidate.engagement);
  const double negative = preferences.negative_signal_strength;

  ActionProbabilities out;
  out.set(Action::Like, base * (0.4 + 0.3 * std::min(1.0, likes / 20.0)));
  out.set(Action::Repost, base * (0.2 + 0.2 * std::min(1.0, reposts / 10.0)));
  out.set(Action::Reply, base * 0.25);
  out.set(Action::Quote, base * 0.15);
  out.set(Action::Click, base * 0.5);
  out.set(Action::Share, base * 0.2);
  out.set(Action::FollowAuthor, base * 0.1);
  out.set(Action::NotInterested, 0.05 * negative);
  out.set(Action::BlockAuthor, 0.02 * negative);
  out.set(Action::MuteAuthor, 0.03 * negative);
  out.set(Action::Report, 0.01 * negative);
  return out;
}

} // namespace feedrank::ranking
