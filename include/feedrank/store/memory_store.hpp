#pragma once

#include "feedrank/common/time.hpp"
#include "feedrank/store/store.hpp"

#include <mutex>

namespace feedrank::store {

/// Process-local store. Keeps a per-author index of post ids in insertion order so the
/// in-network lookup walks only the followed authors.
class MemoryStore final : public IStore {
public:
  explicit MemoryStore(double retention_seconds = 86400.0 * 7,
                       common::Clock clock = common::system_clock());

  [[nodiscard]] std::string_view name() const override { return "memory"; }

  [[nodiscard]] std::optional<User> get_user(const std::string &user_id) override;
  [[nodiscard]] std::unordered_map<std::string, User>
  get_users(const std::vector<std::string> &user_ids) override;
  [[nodiscard]] std::optional<Post> get_post(const std::string &post_id) override;
  [[nodiscard]] std::unordered_map<std::string, Post>
  get_posts(const std::vector<std::string> &post_ids) override;
  [[nodiscard]] std::vector<std::string>
  get_recent_post_ids_for_following(const std::vector<std::string> &following_ids,
                                    std::size_t limit_per_author,
                                    double max_age_seconds) override;
  [[nodiscard]] std::vector<std::string> get_global_recent(std::size_t limit,
                                                           double max_age_seconds) override;
  [[nodiscard]] EngagementCounts get_engagement_counts(const std::string &post_id) override;
  [[nodiscard]] std::vector<TopicCount> get_topic_counts(double max_age_seconds,
                                                         std::size_t limit) override;

  [[nodiscard]] common::Status add_user(const User &user) override;
  [[nodiscard]] common::Status update_user(const User &user) override;
  [[nodiscard]] common::Status add_post(const Post &post) override;
  [[nodiscard]] common::Status add_engagement(const Engagement &engagement) override;
  [[nodiscard]] std::vector<std::string>
  get_user_engagement_post_ids(const std::string &user_id, std::size_t limit) override;
  [[nodiscard]] std::vector<std::string>
  get_negative_engagement_post_ids(const std::string &user_id, std::size_t limit) override;

  [[nodiscard]] std::vector<std::string> list_user_ids();

private:
  [[nodiscard]] double cutoff(double max_age_seconds) const;

  double retention_seconds_;
  common::Clock clock_;
  std::mutex mutex_;
  std::unordered_map<std::string, User> users_;
  std::vector<std::string> user_order_;
  std::unordered_map<std::string, Post> posts_;
  std::unordered_map<std::string, std::vector<std::string>> posts_by_author_;
  std::vector<Engagement> engagements_;
  std::unordered_map<std::string, EngagementCounts> counts_by_post_;
};

} // namespace feedrank::store
