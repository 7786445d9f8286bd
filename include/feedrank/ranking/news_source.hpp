#pragma once

#include "feedrank/common/time.hpp"
#include "feedrank/config/schema.hpp"
#include "feedrank/net/http.hpp"
#include "feedrank/ranking/external_source.hpp"

#include <memory>
#include <optional>
#include <string>

namespace feedrank::ranking {

inline constexpr const char *kNewsAuthorId = "news_api";

/// Collapses whitespace runs to one space and caps the result at `max_chars` code points,
/// ending in "..." when truncated.
[[nodiscard]] std::string sanitize_text(const std::string &text, std::size_t max_chars = 280);

/// NewsAPI.org category to topic; unknown categories map to news.
[[nodiscard]] std::optional<store::Topic> news_category_topic(const std::string &category);

/// "news_" + first 16 hex digits of SHA-256(key).
[[nodiscard]] std::string news_post_id(const std::string &key);

/// Top headlines from NewsAPI.org as out-of-network candidates.
class NewsApiSource final : public IExternalSource {
public:
  NewsApiSource(config::NewsConfig config, std::shared_ptr<net::HttpClient> http,
                common::Clock clock = common::system_clock());

  [[nodiscard]] std::string_view name() const override { return "news_api"; }
  [[nodiscard]] bool available() const override;
  [[nodiscard]] std::vector<Candidate> fetch(std::size_t limit) override;

  [[nodiscard]] std::string request_url(std::size_t limit) const;

  /// Turns a top-headlines response body into candidates. Fails on malformed bodies
  /// and on API-level errors.
  [[nodiscard]] common::Result<std::vector<Candidate>> parse_response(const std::string &body,
                                                                      std::size_t limit) const;

private:
  config::NewsConfig config_;
  std::shared_ptr<net::HttpClient> http_;
  common::Clock clock_;
};

} // namespace feedrank::ranking
