#include "feedrank/store/memory_store.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>

namespace feedrank::store {

MemoryStore::MemoryStore(const double retention_seconds, common::Clock clock)
    : retention_seconds_(retention_seconds), clock_(std::move(clock)) {}

double MemoryStore::cutoff(const double max_age_seconds) const {
  const double window = max_age_seconds > 0.0 ? max_age_seconds : retention_seconds_;
  return clock_() - window;
}

std::optional<User> MemoryStore::get_user(const std::string &user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = users_.find(user_id);
  if (it == users_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::unordered_map<std::string, User> MemoryStore::get_users(const std::vector<std::string> &user_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::string, User> out;
  for (const auto &id : user_ids) {
    if (const auto it = users_.find(id); it != users_.end()) {
      out.emplace(id, it->second);
    }
  }
  return out;
}

std::optional<Post> MemoryStore::get_post(const std::string &post_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = posts_.find(post_id);
  if (it == posts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::unordered_map<std::string, Post> MemoryStore::get_posts(const std::vector<std::string> &post_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::string, Post> out;
  for (const auto &id : post_ids) {
    if (const auto it = posts_.find(id); it != posts_.end()) {
      out.emplace(id, it->second);
    }
  }
  return out;
}

std::vector<std::string>
MemoryStore::get_recent_post_ids_for_following(const std::vector<std::string> &following_ids,
                                               const std::size_t limit_per_author,
                                               const double max_age_seconds) {
  const double min_created = cutoff(max_age_seconds);
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> out;
  for (const auto &author_id : following_ids) {
    const auto it = posts_by_author_.find(author_id);
    if (it == posts_by_author_.end()) {
      continue;
    }

    // Newest first; later inserts win ties.
    std::vector<const Post *> recent;
    for (auto id_it = it->second.rbegin(); id_it != it->second.rend(); ++id_it) {
      const auto post_it = posts_.find(*id_it);
      if (post_it != posts_.end() && post_it->second.created_at >= min_created) {
        recent.push_back(&post_it->second);
      }
    }
    std::stable_sort(recent.begin(), recent.end(), [](const Post *lhs, const Post *rhs) {
      return lhs->created_at > rhs->created_at;
    });
    if (recent.size() > limit_per_author) {
      recent.resize(limit_per_author);
    }
    for (const auto *post : recent) {
      out.push_back(post->id);
    }
  }
  return out;
}

std::vector<std::string> MemoryStore::get_global_recent(const std::size_t limit,
                                                         const double max_age_seconds) {
  const double min_created = cutoff(max_age_seconds);
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<const Post *> pool;
  for (const auto &[id, post] : posts_) {
    if (post.type == PostType::Original && post.created_at >= min_created) {
      pool.push_back(&post);
    }
  }
  std::sort(pool.begin(), pool.end(), [](const Post *lhs, const Post *rhs) {
    if (lhs->created_at != rhs->created_at) {
      return lhs->created_at > rhs->created_at;
    }
    return lhs->id < rhs->id;
  });
  if (pool.size() > limit) {
    pool.resize(limit);
  }

  std::vector<std::string> out;
  out.reserve(pool.size());
  for (const auto *post : pool) {
    out.push_back(post->id);
  }
  return out;
}

EngagementCounts MemoryStore::get_engagement_counts(const std::string &post_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = counts_by_post_.find(post_id);
  return it == counts_by_post_.end() ? EngagementCounts{} : it->second;
}

std::vector<TopicCount> MemoryStore::get_topic_counts(const double max_age_seconds,
                                                      const std::size_t limit) {
  const double min_created = cutoff(max_age_seconds);
  std::lock_guard<std::mutex> lock(mutex_);

  std::map<std::string, std::uint64_t> counts;
  for (const auto &[id, post] : posts_) {
    if (post.created_at < min_created) {
      continue;
    }
    for (const auto topic : post.topics) {
      ++counts[std::string(topic_to_string(topic))];
    }
  }

  std::vector<TopicCount> out;
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

common::Status MemoryStore::add_user(const User &user) {
  if (user.id.empty()) {
    return common::Status::error("user id is empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!users_.contains(user.id)) {
    user_order_.push_back(user.id);
  }
  users_[user.id] = user;
  return common::Status::success();
}

common::Status MemoryStore::update_user(const User &user) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!users_.contains(user.id)) {
      return common::Status::error("unknown user: " + user.id);
    }
  }
  return add_user(user);
}

common::Status MemoryStore::add_post(const Post &post) {
  if (post.id.empty()) {
    return common::Status::error("post id is empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto existing = posts_.find(post.id); existing != posts_.end()) {
    auto &ids = posts_by_author_[existing->second.author_id];
    ids.erase(std::remove(ids.begin(), ids.end(), post.id), ids.end());
  }
  posts_[post.id] = post;
  posts_by_author_[post.author_id].push_back(post.id);
  return common::Status::success();
}

common::Status MemoryStore::add_engagement(const Engagement &engagement) {
  if (engagement.post_id.empty() || engagement.user_id.empty()) {
    return common::Status::error("engagement requires user_id and post_id");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  engagements_.push_back(engagement);
  counts_by_post_[engagement.post_id].add(engagement.type);
  return common::Status::success();
}

std::vector<std::string> MemoryStore::get_user_engagement_post_ids(const std::string &user_id,
                                                                   const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_set<std::string> seen;
  std::vector<std::string> out;
  for (auto it = engagements_.rbegin(); it != engagements_.rend() && out.size() < limit; ++it) {
    if (it->user_id != user_id || !seen.insert(it->post_id).second) {
      continue;
    }
    out.push_back(it->post_id);
  }
  return out;
}

std::vector<std::string> MemoryStore::get_negative_engagement_post_ids(const std::string &user_id,
                                                                       const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_set<std::string> seen;
  std::vector<std::string> out;
  for (auto it = engagements_.rbegin(); it != engagements_.rend() && out.size() < limit; ++it) {
    if (it->user_id != user_id || it->type != EngagementType::NotInterested ||
        !seen.insert(it->post_id).second) {
      continue;
    }
    out.push_back(it->post_id);
  }
  return out;
}

std::vector<std::string> MemoryStore::list_user_ids() {
  std::lock_guard<std::mutex> lock(mutex_);
  return user_order_;
}

} // namespace feedrank::store
