#include "feedrank/ranking/filters.hpp"

namespace feedrank::ranking {

namespace {

template <typename Keep>
std::vector<Candidate> keep_if(const std::vector<Candidate> &candidates, Keep &&keep) {
  std::vector<Candidate> out;
  out.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    if (keep(candidate)) {
      out.push_back(candidate);
    }
  }
  return out;
}

} // namespace

std::vector<Candidate> drop_duplicates(const std::vector<Candidate> &candidates) {
  std::unordered_set<std::string> seen;
  return keep_if(candidates,
                 [&seen](const Candidate &candidate) { return seen.insert(candidate.post.id).second; });
}

std::vector<Candidate> age_filter(const std::vector<Candidate> &candidates,
                                  const double max_age_hours, const double now) {
  const double cutoff = now - max_age_hours * 3600.0;
  return keep_if(candidates,
                 [cutoff](const Candidate &candidate) { return candidate.post.created_at >= cutoff; });
}

std::vector<Candidate> self_post_filter(const std::vector<Candidate> &candidates,
                                        const std::string &viewer_id) {
  return keep_if(candidates, [&viewer_id](const Candidate &candidate) {
    return candidate.post.author_id != viewer_id;
  });
}

std::vector<Candidate> previously_seen_filter(const std::vector<Candidate> &candidates,
                                              const std::unordered_set<std::string> &seen_post_ids) {
  if (seen_post_ids.empty()) {
    return candidates;
  }
  return keep_if(candidates, [&seen_post_ids](const Candidate &candidate) {
    return !seen_post_ids.contains(candidate.post.id);
  });
}

std::vector<Candidate> apply_pre_scoring_filters(const std::vector<Candidate> &candidates,
                                                 const FilterOptions &options) {
  auto out = drop_duplicates(candidates);
  out = age_filter(out, options.max_age_hours, options.now);
  out = self_post_filter(out, options.viewer_id);
  return previously_seen_filter(out, options.seen_post_ids);
}

} // namespace feedrank::ranking
