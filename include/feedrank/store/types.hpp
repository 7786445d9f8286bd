#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace feedrank::store {

enum class PostType {
  Original,
  Reply,
  Repost,
  Quote,
};

enum class Topic {
  Tech,
  Politics,
  Culture,
  Memes,
  Finance,
  News,
  Other,
};

enum class EngagementType {
  Like,
  Repost,
  Reply,
  Quote,
  ProfileClick,
  NotInterested,
};

[[nodiscard]] std::string_view post_type_to_string(PostType type);
[[nodiscard]] std::optional<PostType> post_type_from_string(std::string_view value);
[[nodiscard]] std::string_view topic_to_string(Topic topic);
[[nodiscard]] std::optional<Topic> topic_from_string(std::string_view value);
[[nodiscard]] std::string_view engagement_type_to_string(EngagementType type);
[[nodiscard]] std::optional<EngagementType> engagement_type_from_string(std::string_view value);

struct User {
  std::string id;
  std::string handle;
  std::string display_name;
  std::string bio;
  std::vector<Topic> topics;
  std::optional<std::string> avatar_url;
  std::vector<std::string> following_ids;
  std::uint64_t followers_count = 0;
  std::uint64_t following_count = 0;
};

struct Post {
  std::string id;
  std::string author_id;
  std::string text;
  PostType type = PostType::Original;
  std::optional<std::string> parent_id;
  std::optional<std::string> quoted_id;
  std::vector<Topic> topics;
  // unix seconds
  double created_at = 0.0;
  // Denormalized counters; may lag the engagement log.
  std::uint64_t like_count = 0;
  std::uint64_t repost_count = 0;
  std::uint64_t reply_count = 0;
  std::uint64_t quote_count = 0;
  std::uint64_t view_count = 0;
};

struct Engagement {
  std::string user_id;
  std::string post_id;
  EngagementType type = EngagementType::Like;
  double created_at = 0.0;
};

/// Live engagement tally for one post. Every action type is present, defaulting to zero.
struct EngagementCounts {
  std::uint64_t like = 0;
  std::uint64_t repost = 0;
  std::uint64_t reply = 0;
  std::uint64_t quote = 0;
  std::uint64_t profile_click = 0;
  std::uint64_t not_interested = 0;

  [[nodiscard]] std::uint64_t get(EngagementType type) const;
  void add(EngagementType type, std::uint64_t amount = 1);

  bool operator==(const EngagementCounts &) const = default;
};

struct TopicCount {
  std::string topic;
  std::uint64_t count = 0;
};

} // namespace feedrank::store
