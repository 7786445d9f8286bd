#pragma once

#include "feedrank/ranking/external_source.hpp"
#include "feedrank/ranking/types.hpp"
#include "feedrank/store/store.hpp"

#include <string>
#include <vector>

namespace feedrank::ranking {

struct SourceLimits {
  std::size_t limit_in_network = 200;
  std::size_t limit_per_author = 20;
  std::size_t limit_oon = 150;
  // 0 selects the store's retention window
  double max_age_seconds = 0.0;
};

/// Recent posts by followed authors. Empty for unknown viewers or an empty following list.
[[nodiscard]] std::vector<Candidate> in_network_source(store::IReadStore &store,
                                                       const std::string &user_id,
                                                       const SourceLimits &limits);

/// Newest originals from a 2x pool with followed authors removed.
[[nodiscard]] std::vector<Candidate> out_of_network_source(store::IReadStore &store,
                                                           const std::string &user_id,
                                                           const SourceLimits &limits);

/// In-network, then out-of-network, then external candidates (when a source is given and
/// available).
[[nodiscard]] std::vector<Candidate> get_candidates(store::IReadStore &store,
                                                    const std::string &user_id,
                                                    const SourceLimits &limits,
                                                    IExternalSource *external = nullptr,
                                                    std::size_t external_limit = 25);

} // namespace feedrank::ranking
