#pragma once

#include "feedrank/ranking/preferences.hpp"
#include "feedrank/ranking/types.hpp"

#include <vector>

namespace feedrank::ranking {

/// Nominal penalty for the `occurrence`-th (1-based) post by the same author.
[[nodiscard]] double diversity_penalty(std::size_t occurrence, double diversity_strength);

/// Walks candidates in descending score order, subtracts the repeat-author penalty and
/// floors every score at zero, then re-sorts (stable) and assigns ranks 1..n.
[[nodiscard]] std::vector<ScoredCandidate>
apply_author_diversity(std::vector<ScoredCandidate> scored, const AlgorithmPreferences &preferences);

} // namespace feedrank::ranking
