#pragma once

#include "feedrank/common/result.hpp"
#include "feedrank/store/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace feedrank::store {

/// Read side consumed by the ranking pipeline. Lookups never throw: missing ids are
/// silently dropped and backend failures degrade to empty results.
///
/// A `max_age_seconds` of zero (or less) means "use the store's retention window".
class IReadStore {
public:
  virtual ~IReadStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  [[nodiscard]] virtual std::optional<User> get_user(const std::string &user_id) = 0;
  [[nodiscard]] virtual std::unordered_map<std::string, User>
  get_users(const std::vector<std::string> &user_ids) = 0;

  [[nodiscard]] virtual std::optional<Post> get_post(const std::string &post_id) = 0;
  [[nodiscard]] virtual std::unordered_map<std::string, Post>
  get_posts(const std::vector<std::string> &post_ids) = 0;

  /// Most-recent-first per author, flattened in `following_ids` order.
  [[nodiscard]] virtual std::vector<std::string>
  get_recent_post_ids_for_following(const std::vector<std::string> &following_ids,
                                    std::size_t limit_per_author, double max_age_seconds) = 0;

  /// Original posts only, strictly newest-first.
  [[nodiscard]] virtual std::vector<std::string> get_global_recent(std::size_t limit,
                                                                   double max_age_seconds) = 0;

  [[nodiscard]] virtual EngagementCounts get_engagement_counts(const std::string &post_id) = 0;

  /// (topic, count) pairs, descending by count, ties by topic name.
  [[nodiscard]] virtual std::vector<TopicCount> get_topic_counts(double max_age_seconds,
                                                                 std::size_t limit) = 0;
};

/// Write side used by seeding, the API layer and tests. Users and posts are replaced in
/// place by id; engagements are append-only.
class IStore : public IReadStore {
public:
  [[nodiscard]] virtual common::Status add_user(const User &user) = 0;
  [[nodiscard]] virtual common::Status update_user(const User &user) = 0;
  [[nodiscard]] virtual common::Status add_post(const Post &post) = 0;
  [[nodiscard]] virtual common::Status add_engagement(const Engagement &engagement) = 0;

  /// Distinct posts the user engaged with, most recent engagement first.
  [[nodiscard]] virtual std::vector<std::string>
  get_user_engagement_post_ids(const std::string &user_id, std::size_t limit) = 0;

  /// Distinct posts the user dismissed with not_interested, most recent first.
  [[nodiscard]] virtual std::vector<std::string>
  get_negative_engagement_post_ids(const std::string &user_id, std::size_t limit) = 0;
};

} // namespace feedrank::store
