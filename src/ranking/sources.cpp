#include "feedrank/ranking/sources.hpp"

#include "feedrank/observability/global.hpp"

#include <unordered_set>

namespace feedrank::ranking {

namespace {

// Builds candidates in `post_ids` order; ids the store no longer has are skipped.
std::vector<Candidate> hydrate_candidates(store::IReadStore &store,
                                          const std::vector<std::string> &post_ids,
                                          const CandidateSource source) {
  const auto posts = store.get_posts(post_ids);

  std::vector<std::string> author_ids;
  author_ids.reserve(posts.size());
  for (const auto &[id, post] : posts) {
    author_ids.push_back(post.author_id);
  }
  const auto authors = store.get_users(author_ids);

  std::vector<Candidate> out;
  out.reserve(posts.size());
  for (const auto &id : post_ids) {
    const auto post_it = posts.find(id);
    if (post_it == posts.end()) {
      continue;
    }
    Candidate candidate;
    candidate.post = post_it->second;
    if (const auto author_it = authors.find(candidate.post.author_id); author_it != authors.end()) {
      candidate.author = author_it->second;
    }
    candidate.source = source;
    candidate.engagement = store.get_engagement_counts(id);
    out.push_back(std::move(candidate));
  }
  return out;
}

} // namespace

std::vector<Candidate> in_network_source(store::IReadStore &store, const std::string &user_id,
                                         const SourceLimits &limits) {
  const auto viewer = store.get_user(user_id);
  if (!viewer.has_value() || viewer->following_ids.empty()) {
    return {};
  }

  auto post_ids = store.get_recent_post_ids_for_following(
      viewer->following_ids, limits.limit_per_author, limits.max_age_seconds);
  if (post_ids.size() > limits.limit_in_network) {
    post_ids.resize(limits.limit_in_network);
  }
  return hydrate_candidates(store, post_ids, CandidateSource::InNetwork);
}

std::vector<Candidate> out_of_network_source(store::IReadStore &store, const std::string &user_id,
                                             const SourceLimits &limits) {
  std::unordered_set<std::string> following;
  if (const auto viewer = store.get_user(user_id); viewer.has_value()) {
    following.insert(viewer->following_ids.begin(), viewer->following_ids.end());
  }

  const auto pool = store.get_global_recent(limits.limit_oon * 2, limits.max_age_seconds);
  const auto posts = store.get_posts(pool);

  std::vector<std::string> oon_ids;
  for (const auto &id : pool) {
    if (oon_ids.size() >= limits.limit_oon) {
      break;
    }
    const auto it = posts.find(id);
    if (it != posts.end() && !following.contains(it->second.author_id)) {
      oon_ids.push_back(id);
    }
  }
  return hydrate_candidates(store, oon_ids, CandidateSource::OutOfNetwork);
}

std::vector<Candidate> get_candidates(store::IReadStore &store, const std::string &user_id,
                                      const SourceLimits &limits, IExternalSource *external,
                                      const std::size_t external_limit) {
  auto candidates = in_network_source(store, user_id, limits);
  auto oon = out_of_network_source(store, user_id, limits);

  std::size_t external_count = 0;
  std::vector<Candidate> extra;
  if (external != nullptr && external->available() && external_limit > 0) {
    extra = external->fetch(external_limit);
    external_count = extra.size();
  }

  observability::record_metric(observability::CandidatePoolMetric{
      .in_network = candidates.size(), .out_of_network = oon.size(), .external = external_count});

  candidates.reserve(candidates.size() + oon.size() + extra.size());
  for (auto &candidate : oon) {
    candidates.push_back(std::move(candidate));
  }
  for (auto &candidate : extra) {
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

} // namespace feedrank::ranking
