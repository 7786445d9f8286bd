#pragma once

#include "feedrank/store/store.hpp"

#include <vector>

namespace feedrank::ranking {

/// Topic counts over posts from the last `max_age_hours`, most frequent first with ties
/// broken by topic name.
[[nodiscard]] std::vector<store::TopicCount> trending_topics(store::IReadStore &store,
                                                             double max_age_hours,
                                                             std::size_t limit = 20);

} // namespace feedrank::ranking
