#include "feedrank/ranking/trends.hpp"

#include <algorithm>
#include <limits>

namespace feedrank::ranking {

std::vector<store::TopicCount> trending_topics(store::IReadStore &store, const double max_age_hours,
                                               const std::size_t limit) {
  // Ask for everything so the tie-break happens before truncation.
  auto counts = store.get_topic_counts(max_age_hours * 3600.0, std::numeric_limits<std::size_t>::max());
  std::sort(counts.begin(), counts.end(), [](const store::TopicCount &lhs, const store::TopicCount &rhs) {
    if (lhs.count != rhs.count) {
      return lhs.count > rhs.count;
    }
    return lhs.topic < rhs.topic;
  });
  if (counts.size() > limit) {
    counts.resize(limit);
  }
  return counts;
}

} // namespace feedrank::ranking
