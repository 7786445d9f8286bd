#pragma once

#include "feedrank/ranking/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace feedrank::ranking {

// Filters keep input order and never modify their input.

[[nodiscard]] std::vector<Candidate> drop_duplicates(const std::vector<Candidate> &candidates);

/// Drops posts created before now - max_age_hours.
[[nodiscard]] std::vector<Candidate> age_filter(const std::vector<Candidate> &candidates,
                                                double max_age_hours, double now);

[[nodiscard]] std::vector<Candidate> self_post_filter(const std::vector<Candidate> &candidates,
                                                      const std::string &viewer_id);

[[nodiscard]] std::vector<Candidate>
previously_seen_filter(const std::vector<Candidate> &candidates,
                       const std::unordered_set<std::string> &seen_post_ids);

struct FilterOptions {
  std::string viewer_id;
  double max_age_hours = 168.0;
  double now = 0.0;
  std::unordered_set<std::string> seen_post_ids;
};

/// Duplicates, age, self posts, then seen posts. Applying it twice changes nothing.
[[nodiscard]] std::vector<Candidate> apply_pre_scoring_filters(const std::vector<Candidate> &candidates,
                                                               const FilterOptions &options);

} // namespace feedrank::ranking
