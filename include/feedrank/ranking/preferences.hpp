#pragma once

#include "feedrank/common/result.hpp"

#include <string>

namespace feedrank::ranking {

/// User-facing ranking knobs. Each is nominally in [0, 1]; values outside that range are
/// accepted and simply bias the output.
struct AlgorithmPreferences {
  // 0 = pure recency, 1 = pure popularity
  double recency_vs_popularity = 0.3;
  // 0 = mostly following, 1 = more out-of-network
  double friends_vs_global = 0.4;
  // 0 = niche, 1 = viral
  double niche_vs_viral = 0.5;

  double tech_weight = 0.2;
  double politics_weight = 0.2;
  double culture_weight = 0.2;
  double memes_weight = 0.2;
  double finance_weight = 0.2;

  // 0 = allow author stacking, 1 = strong author diversity
  double diversity_strength = 0.6;
  double exploration = 0.3;
  double negative_signal_strength = 0.8;

  bool operator==(const AlgorithmPreferences &) const = default;
};

[[nodiscard]] std::string preferences_to_json(const AlgorithmPreferences &preferences);

/// Fields missing from `json` keep the values from `base`.
[[nodiscard]] common::Result<AlgorithmPreferences>
preferences_from_json(const std::string &json, const AlgorithmPreferences &base = {});

} // namespace feedrank::ranking
