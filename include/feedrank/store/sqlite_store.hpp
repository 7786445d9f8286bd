#pragma once

#include "feedrank/common/time.hpp"
#include "feedrank/ranking/preferences.hpp"
#include "feedrank/store/store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace feedrank::store {

/// SQLite-backed store. Topic and following lists are stored as JSON arrays. Read
/// failures are reported to the observer and surface as empty results.
class SqliteStore final : public IStore {
public:
  SqliteStore(std::filesystem::path db_path, double retention_seconds = 86400.0 * 7,
              common::Clock clock = common::system_clock());
  ~SqliteStore() override;

  SqliteStore(const SqliteStore &) = delete;
  SqliteStore &operator=(const SqliteStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] bool health_check();
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

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

  [[nodiscard]] common::Result<std::optional<ranking::AlgorithmPreferences>>
  get_preferences(const std::string &user_id);
  [[nodiscard]] common::Status put_preferences(const std::string &user_id,
                                               const ranking::AlgorithmPreferences &preferences);

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] double cutoff(double max_age_seconds) const;
  [[nodiscard]] common::Status write_user(const User &user);
  [[nodiscard]] std::vector<std::string> query_ids(const char *sql, const std::string &key,
                                                   std::size_t limit, const char *context);
  void report_error(const std::string &context) const;

  std::filesystem::path db_path_;
  double retention_seconds_;
  common::Clock clock_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace feedrank::store
