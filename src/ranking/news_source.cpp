#include "feedrank/ranking/news_source.hpp"

#include "feedrank/common/fs.hpp"
#include "feedrank/common/json_util.hpp"
#include "feedrank/observability/global.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace feedrank::ranking {

namespace {

constexpr std::size_t kMaxPageSize = 100;

constexpr std::array<std::pair<std::string_view, store::Topic>, 7> kCategoryTopics = {{
    {"business", store::Topic::Finance},
    {"entertainment", store::Topic::Culture},
    {"general", store::Topic::News},
    {"health", store::Topic::Other},
    {"science", store::Topic::Tech},
    {"sports", store::Topic::Culture},
    {"technology", store::Topic::Tech},
}};

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

bool is_continuation_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

store::User news_author(const std::string &display_name, const store::Topic topic) {
  store::User author;
  author.id = kNewsAuthorId;
  author.handle = kNewsAuthorId;
  author.display_name = display_name;
  author.bio = "Headlines from News API";
  author.topics = {topic};
  return author;
}

} // namespace

std::string sanitize_text(const std::string &text, const std::size_t max_chars) {
  std::string collapsed;
  collapsed.reserve(text.size());
  bool pending_space = false;
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      pending_space = !collapsed.empty();
      continue;
    }
    if (pending_space) {
      collapsed.push_back(' ');
      pending_space = false;
    }
    collapsed.push_back(ch);
  }

  const auto code_points = static_cast<std::size_t>(
      std::count_if(collapsed.begin(), collapsed.end(),
                    [](const char ch) { return !is_continuation_byte(ch); }));
  if (code_points <= max_chars) {
    return collapsed;
  }

  const std::size_t keep = max_chars >= 3 ? max_chars - 3 : 0;
  std::size_t seen = 0;
  std::size_t cut = 0;
  for (; cut < collapsed.size(); ++cut) {
    if (!is_continuation_byte(collapsed[cut])) {
      if (seen == keep) {
        break;
      }
      ++seen;
    }
  }
  return collapsed.substr(0, cut) + "...";
}

std::optional<store::Topic> news_category_topic(const std::string &category) {
  for (const auto &[name, topic] : kCategoryTopics) {
    if (name == category) {
      return topic;
    }
  }
  return std::nullopt;
}

std::string news_post_id(const std::string &key) { return "news_" + sha256_hex(key).substr(0, 16); }

NewsApiSource::NewsApiSource(config::NewsConfig config, std::shared_ptr<net::HttpClient> http,
                             common::Clock clock)
    : config_(std::move(config)), http_(std::move(http)), clock_(std::move(clock)) {}

bool NewsApiSource::available() const {
  return http_ != nullptr && !common::trim(config_.api_key).empty();
}

std::string NewsApiSource::request_url(const std::size_t limit) const {
  std::string url = config_.endpoint;
  url += url.find('?') == std::string::npos ? "?" : "&";
  url += "apiKey=" + net::url_encode(common::trim(config_.api_key));
  url += "&pageSize=" + std::to_string(std::min(limit, kMaxPageSize));

  const std::string country = common::to_lower(common::trim(config_.country));
  if (country.size() == 2) {
    url += "&country=" + net::url_encode(country);
  }
  const std::string category = common::to_lower(common::trim(config_.category));
  if (news_category_topic(category).has_value()) {
    url += "&category=" + category;
  }
  return url;
}

common::Result<std::vector<Candidate>> NewsApiSource::parse_response(const std::string &body,
                                                                     const std::size_t limit) const {
  using ResultType = common::Result<std::vector<Candidate>>;
  const std::string trimmed = common::trim(body);
  if (trimmed.empty() || trimmed.front() != '{') {
    return ResultType::failure("response is not a JSON object");
  }
  if (common::json_get_string(trimmed, "status") == "error") {
    return ResultType::failure("api error: " + common::json_get_string(trimmed, "message"));
  }
  const std::string articles_json = common::json_get_array(trimmed, "articles");
  if (articles_json.empty()) {
    return ResultType::failure("response has no articles array");
  }

  const std::string default_category = common::to_lower(common::trim(config_.category));
  const double now = clock_();
  const auto articles = common::json_split_top_level_objects(articles_json);

  std::vector<Candidate> out;
  for (std::size_t i = 0; i < articles.size() && out.size() < limit; ++i) {
    const std::string &article = articles[i];
    const std::string title = common::trim(common::json_get_string(article, "title"));
    if (title.empty()) {
      continue;
    }
    const std::string description = common::trim(common::json_get_string(article, "description"));
    const std::string url = common::trim(common::json_get_string(article, "url"));

    std::string source_name =
        common::trim(common::json_get_string(common::json_get_object(article, "source"), "name"));
    if (source_name.empty()) {
      source_name = "News";
    }

    std::string category = common::to_lower(common::json_get_string(article, "category"));
    if (category.empty()) {
      category = default_category.empty() ? "general" : default_category;
    }
    const store::Topic topic = news_category_topic(category).value_or(store::Topic::News);

    double created_at = now - static_cast<double>(i) * 60.0;
    if (const std::string published = common::json_get_string(article, "publishedAt");
        !published.empty()) {
      if (const auto parsed = common::parse_rfc3339(published); parsed.ok()) {
        created_at = parsed.value();
      }
    }

    Candidate candidate;
    candidate.post.id = news_post_id(url.empty() ? title : url);
    candidate.post.author_id = kNewsAuthorId;
    candidate.post.text = sanitize_text(description.empty() ? title : title + " " + description);
    candidate.post.type = store::PostType::Original;
    candidate.post.topics = {topic};
    candidate.post.created_at = created_at;
    candidate.author = news_author(source_name, topic);
    candidate.source = CandidateSource::OutOfNetwork;
    out.push_back(std::move(candidate));
  }
  return ResultType::success(std::move(out));
}

std::vector<Candidate> NewsApiSource::fetch(const std::size_t limit) {
  if (!available() || limit == 0) {
    return {};
  }

  const auto response = http_->get(request_url(limit), {{"Accept", "application/json"}},
                                   config_.timeout_ms);
  if (!response.success()) {
    std::string reason = response.network_error ? response.network_error_message
                                                : "HTTP " + std::to_string(response.status);
    if (response.timeout) {
      reason = "timed out after " + std::to_string(config_.timeout_ms) + "ms";
    }
    observability::record_error("news_api", reason);
    observability::record_external_fetch(std::string(name()), 0, false);
    return {};
  }

  auto parsed = parse_response(response.body, limit);
  if (!parsed.ok()) {
    observability::record_error("news_api", parsed.error());
    observability::record_external_fetch(std::string(name()), 0, false);
    return {};
  }

  observability::record_external_fetch(std::string(name()), parsed.value().size(), true);
  return std::move(parsed.value());
}

} // namespace feedrank::ranking
