#include "feedrank/ranking/home_mixer.hpp"

#include "feedrank/observability/global.hpp"
#include "feedrank/ranking/diversity.hpp"
#include "feedrank/ranking/filters.hpp"

#include <chrono>

namespace feedrank::ranking {

MixerOptions mixer_options_from_config(const config::RankingConfig &ranking) {
  MixerOptions options;
  options.limits.limit_in_network = ranking.limit_in_network;
  options.limits.limit_per_author = ranking.limit_per_author;
  options.limits.limit_oon = ranking.limit_oon;
  options.following_only_limit = ranking.following_only_limit;
  options.max_age_hours = ranking.max_age_hours;
  options.external_limit = ranking.external_limit;
  return options;
}

HomeMixer::HomeMixer(store::IReadStore &store, MixerOptions options, common::Clock clock)
    : store_(store), options_(std::move(options)), clock_(std::move(clock)) {}

void HomeMixer::set_action_model(std::shared_ptr<const IActionModel> model) {
  scorer_ = WeightedScorer(std::move(model));
}

void HomeMixer::set_external_source(std::shared_ptr<IExternalSource> source) {
  external_ = std::move(source);
}

std::vector<Candidate> HomeMixer::source_candidates(const FeedRequest &request) {
  if (request.following_only) {
    SourceLimits limits = options_.limits;
    limits.limit_in_network = options_.following_only_limit;
    return in_network_source(store_, request.user_id, limits);
  }
  return get_candidates(store_, request.user_id, options_.limits, external_.get(),
                        options_.external_limit);
}

HydratedPost HomeMixer::hydrate(const Candidate &candidate) {
  HydratedPost out;
  out.post = candidate.post;

  const auto counts = store_.get_engagement_counts(candidate.post.id);
  out.post.like_count = counts.like;
  out.post.repost_count = counts.repost;
  out.post.reply_count = counts.reply;
  out.post.quote_count = counts.quote;

  out.author = store_.get_user(candidate.post.author_id);
  if (!out.author.has_value()) {
    out.author = candidate.author;
  }
  return out;
}

std::optional<HydratedPost> HomeMixer::hydrate_reference(const std::optional<std::string> &post_id) {
  if (!post_id.has_value()) {
    return std::nullopt;
  }
  auto post = store_.get_post(*post_id);
  if (!post.has_value()) {
    return std::nullopt;
  }
  HydratedPost out;
  out.author = store_.get_user(post->author_id);
  out.post = std::move(*post);
  return out;
}

FeedResponse HomeMixer::get_feed(const FeedRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  const double now = clock_();
  const AlgorithmPreferences preferences = request.preferences.value_or(AlgorithmPreferences{});

  observability::record_feed_request(request.user_id, request.limit, request.following_only);

  auto candidates = source_candidates(request);
  observability::record_stage("sourced", candidates.size());

  const FilterOptions filter_options{.viewer_id = request.user_id,
                                     .max_age_hours = options_.max_age_hours,
                                     .now = now,
                                     .seen_post_ids = request.seen_post_ids};
  candidates = apply_pre_scoring_filters(candidates, filter_options);
  observability::record_stage("filtered", candidates.size());

  auto scored = apply_author_diversity(scorer_.score(candidates, preferences, now), preferences);
  observability::record_stage("scored", scored.size());

  if (scored.size() > request.limit) {
    scored.resize(request.limit);
  }

  FeedResponse response;
  response.items.reserve(scored.size());
  for (auto &item : scored) {
    FeedItem feed_item;
    feed_item.post = hydrate(item.candidate);
    if (request.include_explanations) {
      feed_item.explanation = std::move(item.explanation);
    }
    feed_item.parent_post = hydrate_reference(item.candidate.post.parent_id);
    feed_item.quoted_post = hydrate_reference(item.candidate.post.quoted_id);
    response.items.push_back(std::move(feed_item));
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_feed_served(request.user_id, response.items.size(), elapsed);
  return response;
}

} // namespace feedrank::ranking
