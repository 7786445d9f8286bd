#include "feedrank/store/types.hpp"

#include <array>
#include <utility>

namespace feedrank::store {

namespace {

constexpr std::array<std::pair<PostType, std::string_view>, 4> kPostTypes = {{
    {PostType::Original, "original"},
    {PostType::Reply, "reply"},
    {PostType::Repost, "repost"},
    {PostType::Quote, "quote"},
}};

constexpr std::array<std::pair<Topic, std::string_view>, 7> kTopics = {{
    {Topic::Tech, "tech"},
    {Topic::Politics, "politics"},
    {Topic::Culture, "culture"},
    {Topic::Memes, "memes"},
    {Topic::Finance, "finance"},
    {Topic::News, "news"},
    {Topic::Other, "other"},
}};

constexpr std::array<std::pair<EngagementType, std::string_view>, 6> kEngagementTypes = {{
    {EngagementType::Like, "like"},
    {EngagementType::Repost, "repost"},
    {EngagementType::Reply, "reply"},
    {EngagementType::Quote, "quote"},
    {EngagementType::ProfileClick, "profile_click"},
    {EngagementType::NotInterested, "not_interested"},
}};

template <typename Enum, std::size_t N>
std::string_view lookup_name(const std::array<std::pair<Enum, std::string_view>, N> &table,
                             const Enum value) {
  for (const auto &[entry, name] : table) {
    if (entry == value) {
      return name;
    }
  }
  return "unknown";
}

template <typename Enum, std::size_t N>
std::optional<Enum> lookup_value(const std::array<std::pair<Enum, std::string_view>, N> &table,
                                 const std::string_view name) {
  for (const auto &[entry, entry_name] : table) {
    if (entry_name == name) {
      return entry;
    }
  }
  return std::nullopt;
}

} // namespace

std::string_view post_type_to_string(const PostType type) { return lookup_name(kPostTypes, type); }

std::optional<PostType> post_type_from_string(const std::string_view value) {
  return lookup_value(kPostTypes, value);
}

std::string_view topic_to_string(const Topic topic) { return lookup_name(kTopics, topic); }

std::optional<Topic> topic_from_string(const std::string_view value) {
  return lookup_value(kTopics, value);
}

std::string_view engagement_type_to_string(const EngagementType type) {
  return lookup_name(kEngagementTypes, type);
}

std::optional<EngagementType> engagement_type_from_string(const std::string_view value) {
  return lookup_value(kEngagementTypes, value);
}

std::uint64_t EngagementCounts::get(const EngagementType type) const {
  switch (type) {
  case EngagementType::Like:
    return like;
  case EngagementType::Repost:
    return repost;
  case EngagementType::Reply:
    return reply;
  case EngagementType::Quote:
    return quote;
  case EngagementType::ProfileClick:
    return profile_click;
  case EngagementType::NotInterested:
    return not_interested;
  }
  return 0;
}

void EngagementCounts::add(const EngagementType type, const std::uint64_t amount) {
  switch (type) {
  case EngagementType::Like:
    like += amount;
    break;
  case EngagementType::Repost:
    repost += amount;
    break;
  case EngagementType::Reply:
    reply += amount;
    break;
  case EngagementType::Quote:
    quote += amount;
    break;
  case EngagementType::ProfileClick:
    profile_click += amount;
    break;
  case EngagementType::NotInterested:
    not_interested += amount;
    break;
  }
}

} // namespace feedrank::store
