#include "feedrank/ranking/feed_json.hpp"

#include "feedrank/common/json_util.hpp"

#include <sstream>

namespace feedrank::ranking {

namespace {

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

std::string quoted(const std::string_view value) { return quoted(std::string(value)); }

std::string optional_string(const std::optional<std::string> &value) {
  return value.has_value() ? quoted(*value) : "null";
}

std::string topics_json(const std::vector<store::Topic> &topics) {
  std::vector<std::string> names;
  names.reserve(topics.size());
  for (const auto topic : topics) {
    names.emplace_back(store::topic_to_string(topic));
  }
  return common::json_string_array(names);
}

std::string extensions_json(const Extensions &extensions) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto &[key, value] : extensions) {
    out << (first ? "" : ",") << quoted(key) << ":" << common::json_number(value);
    first = false;
  }
  out << "}";
  return out.str();
}

std::string probabilities_json(const ActionProbabilities &probabilities) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto action : all_actions()) {
    out << (first ? "" : ",") << quoted(action_name(action)) << ":"
        << common::json_number(probabilities.get(action));
    first = false;
  }
  out << "}";
  return out.str();
}

std::string optional_post(const std::optional<HydratedPost> &post) {
  return post.has_value() ? hydrated_post_to_json(*post) : "null";
}

} // namespace

std::string user_to_json(const store::User &user) {
  std::ostringstream out;
  out << "{\"id\":" << quoted(user.id) << ",\"handle\":" << quoted(user.handle)
      << ",\"display_name\":" << quoted(user.display_name) << ",\"bio\":" << quoted(user.bio)
      << ",\"topics\":" << topics_json(user.topics)
      << ",\"avatar_url\":" << optional_string(user.avatar_url)
      << ",\"following_ids\":" << common::json_string_array(user.following_ids)
      << ",\"followers_count\":" << user.followers_count
      << ",\"following_count\":" << user.following_count << "}";
  return out.str();
}

std::string hydrated_post_to_json(const HydratedPost &hydrated) {
  const auto &post = hydrated.post;
  std::ostringstream out;
  out << "{\"id\":" << quoted(post.id) << ",\"author_id\":" << quoted(post.author_id)
      << ",\"text\":" << quoted(post.text)
      << ",\"post_type\":" << quoted(store::post_type_to_string(post.type))
      << ",\"parent_id\":" << optional_string(post.parent_id)
      << ",\"quoted_id\":" << optional_string(post.quoted_id)
      << ",\"topics\":" << topics_json(post.topics)
      << ",\"created_at\":" << common::json_number(post.created_at)
      << ",\"like_count\":" << post.like_count << ",\"repost_count\":" << post.repost_count
      << ",\"reply_count\":" << post.reply_count << ",\"quote_count\":" << post.quote_count
      << ",\"view_count\":" << post.view_count << ",\"author\":"
      << (hydrated.author.has_value() ? user_to_json(*hydrated.author) : "null") << "}";
  return out.str();
}

std::string explanation_to_json(const RankingExplanation &explanation) {
  std::ostringstream out;
  out << "{\"post_id\":" << quoted(explanation.post_id)
      << ",\"final_score\":" << common::json_number(explanation.final_score)
      << ",\"rank\":" << explanation.rank
      << ",\"source\":" << quoted(source_to_string(explanation.source)) << ",\"action_scores\":[";
  for (std::size_t i = 0; i < explanation.action_scores.size(); ++i) {
    const auto &score = explanation.action_scores[i];
    out << (i > 0 ? "," : "") << "{\"action\":" << quoted(action_name(score.action))
        << ",\"weight\":" << common::json_number(score.weight)
        << ",\"probability\":" << common::json_number(score.probability)
        << ",\"contribution\":" << common::json_number(score.contribution) << "}";
  }

  const auto &breakdown = explanation.breakdown;
  out << "],\"diversity_penalty\":" << common::json_number(explanation.diversity_penalty)
      << ",\"recency_boost\":" << common::json_number(explanation.recency_boost)
      << ",\"topic_boost\":" << common::json_number(explanation.topic_boost)
      << ",\"breakdown\":{\"in_network_multiplier\":"
      << common::json_number(breakdown.in_network_multiplier)
      << ",\"topic_adjustment\":" << common::json_number(breakdown.topic_adjustment)
      << ",\"recency_adjustment\":" << common::json_number(breakdown.recency_adjustment)
      << ",\"diversity_reduction\":" << common::json_number(breakdown.diversity_reduction)
      << ",\"probabilities\":" << probabilities_json(breakdown.probabilities)
      << ",\"extensions\":" << extensions_json(breakdown.extensions) << "}}";
  return out.str();
}

std::string feed_to_json(const FeedResponse &response) {
  std::ostringstream out;
  out << "{\"items\":[";
  for (std::size_t i = 0; i < response.items.size(); ++i) {
    const auto &item = response.items[i];
    out << (i > 0 ? "," : "") << "{\"post\":" << hydrated_post_to_json(item.post)
        << ",\"ranking_explanation\":"
        << (item.explanation.has_value() ? explanation_to_json(*item.explanation) : "null")
        << ",\"parent_post\":" << optional_post(item.parent_post)
        << ",\"quoted_post\":" << optional_post(item.quoted_post) << "}";
  }
  out << "],\"next_cursor\":" << optional_string(response.next_cursor) << "}";
  return out.str();
}

std::string topic_counts_to_json(const std::vector<store::TopicCount> &counts) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < counts.size(); ++i) {
    out << (i > 0 ? "," : "") << "{\"topic\":" << quoted(counts[i].topic)
        << ",\"count\":" << counts[i].count << "}";
  }
  out << "]";
  return out.str();
}

} // namespace feedrank::ranking
