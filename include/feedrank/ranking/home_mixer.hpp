#pragma once

#include "feedrank/common/time.hpp"
#include "feedrank/config/schema.hpp"
#include "feedrank/ranking/action_model.hpp"
#include "feedrank/ranking/external_source.hpp"
#include "feedrank/ranking/preferences.hpp"
#include "feedrank/ranking/scorer.hpp"
#include "feedrank/ranking/sources.hpp"
#include "feedrank/ranking/types.hpp"
#include "feedrank/store/store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

namespace feedrank::ranking {

struct MixerOptions {
  SourceLimits limits;
  std::size_t following_only_limit = 300;
  double max_age_hours = 168.0;
  std::size_t external_limit = 25;
};

[[nodiscard]] MixerOptions mixer_options_from_config(const config::RankingConfig &ranking);

struct FeedRequest {
  std::string user_id;
  // Defaults apply when absent.
  std::optional<AlgorithmPreferences> preferences;
  std::size_t limit = 50;
  std::unordered_set<std::string> seen_post_ids;
  bool include_explanations = true;
  // Following tab: in-network only, no out-of-network or external fallback.
  bool following_only = false;
};

/// Runs sources, filters, scoring, author diversity, top-K selection and hydration for one
/// viewer. The clock is read once per request so every stage sees the same instant.
class HomeMixer {
public:
  explicit HomeMixer(store::IReadStore &store, MixerOptions options = {},
                     common::Clock clock = common::system_clock());

  void set_action_model(std::shared_ptr<const IActionModel> model);
  void set_external_source(std::shared_ptr<IExternalSource> source);

  /// The viewer is expected to exist; an unknown viewer gets at most out-of-network items.
  [[nodiscard]] FeedResponse get_feed(const FeedRequest &request);

  [[nodiscard]] const MixerOptions &options() const { return options_; }

private:
  [[nodiscard]] std::vector<Candidate> source_candidates(const FeedRequest &request);
  [[nodiscard]] HydratedPost hydrate(const Candidate &candidate);
  [[nodiscard]] std::optional<HydratedPost> hydrate_reference(const std::optional<std::string> &post_id);

  store::IReadStore &store_;
  MixerOptions options_;
  common::Clock clock_;
  WeightedScorer scorer_;
  std::shared_ptr<IExternalSource> external_;
};

} // namespace feedrank::ranking
