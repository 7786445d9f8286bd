#include "feedrank/store/sqlite_store.hpp"

#include "feedrank/common/json_util.hpp"
#include "feedrank/observability/global.hpp"

#include <algorithm>
#include <map>

namespace feedrank::store {

namespace {

constexpr const char *kUserColumns =
    "id, handle, display_name, bio, topics, avatar_url, following_ids, followers_count, "
    "following_count";

constexpr const char *kPostColumns =
    "id, author_id, text, type, parent_id, quoted_id, topics, created_at, like_count, "
    "repost_count, reply_count, quote_count, view_count";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : reinterpret_cast<const char *>(text);
}

std::optional<std::string> column_optional_text(sqlite3_stmt *stmt, const int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, column);
}

std::uint64_t column_u64(sqlite3_stmt *stmt, const int column) {
  const auto value = sqlite3_column_int64(stmt, column);
  return value < 0 ? 0 : static_cast<std::uint64_t>(value);
}

void bind_optional_text(sqlite3_stmt *stmt, const int index,
                        const std::optional<std::string> &value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::string topics_to_json(const std::vector<Topic> &topics) {
  std::vector<std::string> names;
  names.reserve(topics.size());
  for (const auto topic : topics) {
    names.emplace_back(topic_to_string(topic));
  }
  return common::json_string_array(names);
}

// Unknown topic names are skipped.
std::vector<Topic> topics_from_json(const std::string &json) {
  std::vector<Topic> out;
  for (const auto &name : common::json_parse_string_array(json)) {
    if (const auto topic = topic_from_string(name); topic.has_value()) {
      out.push_back(*topic);
    }
  }
  return out;
}

User user_from_row(sqlite3_stmt *stmt) {
  User user;
  user.id = column_text(stmt, 0);
  user.handle = column_text(stmt, 1);
  user.display_name = column_text(stmt, 2);
  user.bio = column_text(stmt, 3);
  user.topics = topics_from_json(column_text(stmt, 4));
  user.avatar_url = column_optional_text(stmt, 5);
  user.following_ids = common::json_parse_string_array(column_text(stmt, 6));
  user.followers_count = column_u64(stmt, 7);
  user.following_count = column_u64(stmt, 8);
  return user;
}

Post post_from_row(sqlite3_stmt *stmt) {
  Post post;
  post.id = column_text(stmt, 0);
  post.author_id = column_text(stmt, 1);
  post.text = column_text(stmt, 2);
  post.type = post_type_from_string(column_text(stmt, 3)).value_or(PostType::Original);
  post.parent_id = column_optional_text(stmt, 4);
  post.quoted_id = column_optional_text(stmt, 5);
  post.topics = topics_from_json(column_text(stmt, 6));
  post.created_at = sqlite3_column_double(stmt, 7);
  post.like_count = column_u64(stmt, 8);
  post.repost_count = column_u64(stmt, 9);
  post.reply_count = column_u64(stmt, 10);
  post.quote_count = column_u64(stmt, 11);
  post.view_count = column_u64(stmt, 12);
  return post;
}

} // namespace

SqliteStore::SqliteStore(std::filesystem::path db_path, const double retention_seconds,
                         common::Clock clock)
    : db_path_(std::move(db_path)), retention_seconds_(retention_seconds),
      clock_(std::move(clock)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    report_error("open " + db_path_.string());
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  const auto status = init_schema();
  if (!status.ok()) {
    observability::record_error("sqlite_store", "schema: " + status.error());
  }
}

SqliteStore::~SqliteStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

bool SqliteStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_ != nullptr && exec_sql(db_, "SELECT 1;").ok();
}

common::Status SqliteStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS users (
  id TEXT PRIMARY KEY,
  handle TEXT NOT NULL,
  display_name TEXT NOT NULL,
  bio TEXT NOT NULL DEFAULT '',
  topics TEXT NOT NULL DEFAULT '[]',
  avatar_url TEXT,
  following_ids TEXT NOT NULL DEFAULT '[]',
  followers_count INTEGER NOT NULL DEFAULT 0,
  following_count INTEGER NOT NULL DEFAULT 0
);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS posts (
  id TEXT PRIMARY KEY,
  author_id TEXT NOT NULL,
  text TEXT NOT NULL,
  type TEXT NOT NULL DEFAULT 'original',
  parent_id TEXT,
  quoted_id TEXT,
  topics TEXT NOT NULL DEFAULT '[]',
  created_at REAL NOT NULL,
  like_count INTEGER NOT NULL DEFAULT 0,
  repost_count INTEGER NOT NULL DEFAULT 0,
  reply_count INTEGER NOT NULL DEFAULT 0,
  quote_count INTEGER NOT NULL DEFAULT 0,
  view_count INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_posts_author_created ON posts(author_id, created_at DESC);
CREATE INDEX IF NOT EXISTS idx_posts_created ON posts(created_at DESC);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS engagements (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id TEXT NOT NULL,
  post_id TEXT NOT NULL,
  type TEXT NOT NULL,
  created_at REAL NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_engagements_post ON engagements(post_id);
CREATE INDEX IF NOT EXISTS idx_engagements_user ON engagements(user_id, seq DESC);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS preferences (
  user_id TEXT PRIMARY KEY,
  data TEXT NOT NULL,
  updated_at REAL NOT NULL
);
)");
  return status;
}

double SqliteStore::cutoff(const double max_age_seconds) const {
  const double window = max_age_seconds > 0.0 ? max_age_seconds : retention_seconds_;
  return clock_() - window;
}

void SqliteStore::report_error(const std::string &context) const {
  const std::string detail = db_ == nullptr ? "database is not open" : sqlite3_errmsg(db_);
  observability::record_error("sqlite_store", context + ": " + detail);
}

std::optional<User> SqliteStore::get_user(const std::string &user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return std::nullopt;
  }

  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kUserColumns + " FROM users WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    report_error("get_user");
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<User> out;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    out = user_from_row(stmt);
  }
  sqlite3_finalize(stmt);
  return out;
}

std::unordered_map<std::string, User> SqliteStore::get_users(const std::vector<std::string> &user_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::string, User> out;
  if (db_ == nullptr || user_ids.empty()) {
    return out;
  }

  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kUserColumns + " FROM users WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    report_error("get_users");
    return out;
  }
  for (const auto &id : user_ids) {
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
      out.emplace(id, user_from_row(stmt));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
  }
  sqlite3_finalize(stmt);
  return out;
}

std::optional<Post> SqliteStore::get_post(const std::string &post_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return std::nullopt;
  }

  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kPostColumns + " FROM posts WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    report_error("get_post");
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, post_id.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<Post> out;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    out = post_from_row(stmt);
  }
  sqlite3_finalize(stmt);
  return out;
}

std::unordered_map<std::string, Post> SqliteStore::get_posts(const std::vector<std::string> &post_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::string, Post> out;
  if (db_ == nullptr || post_ids.empty()) {
    return out;
  }

  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kPostColumns + " FROM posts WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    report_error("get_posts");
    return out;
  }
  for (const auto &id : post_ids) {
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
      out.emplace(id, post_from_row(stmt));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
  }
  sqlite3_finalize(stmt);
  return out;
}

std::vector<std::string>
SqliteStore::get_recent_post_ids_for_following(const std::vector<std::string> &following_ids,
                                               const std::size_t limit_per_author,
                                               const double max_age_seconds) {
  const double min_created = cutoff(max_age_seconds);
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  if (db_ == nullptr || following_ids.empty() || limit_per_author == 0) {
    return out;
  }

  // rowid DESC keeps the most recently written post first among equal timestamps.
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id FROM posts WHERE author_id = ?1 AND created_at >= ?2 "
                    "ORDER BY created_at DESC, rowid DESC LIMIT ?3";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    report_error("get_recent_post_ids_for_following");
    return out;
  }
  for (const auto &author_id : following_ids) {
    sqlite3_bind_text(stmt, 1, author_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt, 2, min_created);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(limit_per_author));
    while (sqlite3_step(stmt) == SQLITE_ROW) {
      out.push_back(column_text(stmt, 0));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
  }
  sqlite3_finalize(stmt);
  return out;
}

std::vector<std::string> SqliteStore::get_global_recent(const std::size_t limit,
                                                         const double max_age_seconds) {
  const double min_created = cutoff(max_age_seconds);
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  if (db_ == nullptr || limit == 0) {
    return out;
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT id FROM posts WHERE type = 'original' AND created_at >= ?1 "
                    "ORDER BY created_at DESC, id ASC LIMIT ?2";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    report_error("get_global_recent");
    return out;
  }
  sqlite3_bind_double(stmt, 1, min_created);
  sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    out.push_back(column_text(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return out;
}

EngagementCounts SqliteStore::get_engagement_counts(const std::string &post_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  EngagementCounts counts;
  if (db_ == nullptr) {
    return counts;
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT type, COUNT(*) FROM engagements WHERE post_id = ?1 GROUP BY type";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    report_error("get_engagement_counts");
    return counts;
  }
  sqlite3_bind_text(stmt, 1, post_id.c_str(), -1, SQLITE_TRANSIENT);
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    if (const auto type = engagement_type_from_string(column_text(stmt, 0)); type.has_value()) {
      counts.add(*type, column_u64(stmt, 1));
    }
  }
  sqlite3_finalize(stmt);
  return counts;
}

std::vector<TopicCount> SqliteStore::get_topic_counts(const double max_age_seconds,
                                                      const std::size_t limit) {
  const double min_created = cutoff(max_age_seconds);
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TopicCount> out;
  if (db_ == nullptr) {
    return out;
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT topics FROM posts WHERE created_at >= ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    report_error("get_topic_counts");
    return out;
  }
  sqlite3_bind_double(stmt, 1, min_created);

  std::map<std::string, std::uint64_t> counts;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    for (const auto topic : topics_from_json(column_text(stmt, 0))) {
      ++counts[std::string(topic_to_string(topic))];
    }
  }
  sqlite3_finalize(stmt);

  out.reserve(counts.size());
  for (const auto &[topic, count] : counts) {
    out.push_back(TopicCount{.topic = topic, .count = count});
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const TopicCount &lhs, const TopicCount &rhs) { return lhs.count > rhs.count; });
  if (out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

common::Status SqliteStore::write_user(const User &user) {
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("INSERT OR REPLACE INTO users(") + kUserColumns +
                          ") VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string topics = topics_to_json(user.topics);
  const std::string following = common::json_string_array(user.following_ids);
  sqlite3_bind_text(stmt, 1, user.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, user.handle.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, user.display_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, user.bio.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, topics.c_str(), -1, SQLITE_TRANSIENT);
  bind_optional_text(stmt, 6, user.avatar_url);
  sqlite3_bind_text(stmt, 7, following.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(user.followers_count));
  sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(user.following_count));

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SqliteStore::add_user(const User &user) {
  if (user.id.empty()) {
    return common::Status::error("user id is empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }
  return write_user(user);
}

common::Status SqliteStore::update_user(const User &user) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT 1 FROM users WHERE id = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, user.id.c_str(), -1, SQLITE_TRANSIENT);
  const bool exists = sqlite3_step(stmt) == SQLITE_ROW;
  sqlite3_finalize(stmt);
  if (!exists) {
    return common::Status::error("unknown user: " + user.id);
  }
  return write_user(user);
}

common::Status SqliteStore::add_post(const Post &post) {
  if (post.id.empty()) {
    return common::Status::error("post id is empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("INSERT OR REPLACE INTO posts(") + kPostColumns +
                          ") VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string type(post_type_to_string(post.type));
  const std::string topics = topics_to_json(post.topics);
  sqlite3_bind_text(stmt, 1, post.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, post.author_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, post.text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, type.c_str(), -1, SQLITE_TRANSIENT);
  bind_optional_text(stmt, 5, post.parent_id);
  bind_optional_text(stmt, 6, post.quoted_id);
  sqlite3_bind_text(stmt, 7, topics.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 8, post.created_at);
  sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(post.like_count));
  sqlite3_bind_int64(stmt, 10, static_cast<sqlite3_int64>(post.repost_count));
  sqlite3_bind_int64(stmt, 11, static_cast<sqlite3_int64>(post.reply_count));
  sqlite3_bind_int64(stmt, 12, static_cast<sqlite3_int64>(post.quote_count));
  sqlite3_bind_int64(stmt, 13, static_cast<sqlite3_int64>(post.view_count));

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SqliteStore::add_engagement(const Engagement &engagement) {
  if (engagement.post_id.empty() || engagement.user_id.empty()) {
    return common::Status::error("engagement requires user_id and post_id");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT INTO engagements(user_id, post_id, type, created_at) VALUES(?1, ?2, ?3, ?4)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string type(engagement_type_to_string(engagement.type));
  sqlite3_bind_text(stmt, 1, engagement.user_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, engagement.post_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 4, engagement.created_at);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

std::vector<std::string> SqliteStore::query_ids(const char *sql, const std::string &key,
                                                const std::size_t limit, const char *context) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  if (db_ == nullptr || limit == 0) {
    return out;
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    report_error(context);
    return out;
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(limit));
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    out.push_back(column_text(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return out;
}

std::vector<std::string> SqliteStore::get_user_engagement_post_ids(const std::string &user_id,
                                                                   const std::size_t limit) {
  return query_ids("SELECT post_id FROM engagements WHERE user_id = ?1 "
                   "GROUP BY post_id ORDER BY MAX(seq) DESC LIMIT ?2",
                   user_id, limit, "get_user_engagement_post_ids");
}

std::vector<std::string> SqliteStore::get_negative_engagement_post_ids(const std::string &user_id,
                                                                       const std::size_t limit) {
  return query_ids("SELECT post_id FROM engagements WHERE user_id = ?1 "
                   "AND type = 'not_interested' GROUP BY post_id ORDER BY MAX(seq) DESC LIMIT ?2",
                   user_id, limit, "get_negative_engagement_post_ids");
}

common::Result<std::optional<ranking::AlgorithmPreferences>>
SqliteStore::get_preferences(const std::string &user_id) {
  using ResultType = common::Result<std::optional<ranking::AlgorithmPreferences>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return ResultType::failure("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT data FROM preferences WHERE user_id = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return ResultType::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      return ResultType::failure(sqlite3_errmsg(db_));
    }
    return ResultType::success(std::nullopt);
  }
  const std::string data = column_text(stmt, 0);
  sqlite3_finalize(stmt);

  auto parsed = ranking::preferences_from_json(data);
  if (!parsed.ok()) {
    return ResultType::failure("stored preferences for " + user_id + ": " + parsed.error());
  }
  return ResultType::success(parsed.value());
}

common::Status SqliteStore::put_preferences(const std::string &user_id,
                                            const ranking::AlgorithmPreferences &preferences) {
  if (user_id.empty()) {
    return common::Status::error("user id is empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT OR REPLACE INTO preferences(user_id, data, updated_at) VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string data = ranking::preferences_to_json(preferences);
  sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, data.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 3, clock_());

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

} // namespace feedrank::store
