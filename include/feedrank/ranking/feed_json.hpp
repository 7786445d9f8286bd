#pragma once

#include "feedrank/ranking/types.hpp"

#include <string>
#include <vector>

namespace feedrank::ranking {

// Compact JSON with a fixed key order, so equal inputs always serialize identically.

[[nodiscard]] std::string user_to_json(const store::User &user);
[[nodiscard]] std::string hydrated_post_to_json(const HydratedPost &post);
[[nodiscard]] std::string explanation_to_json(const RankingExplanation &explanation);
[[nodiscard]] std::string feed_to_json(const FeedResponse &response);
[[nodiscard]] std::string topic_counts_to_json(const std::vector<store::TopicCount> &counts);

} // namespace feedrank::ranking
