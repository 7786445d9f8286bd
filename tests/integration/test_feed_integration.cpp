#include "test_framework.hpp"

#include "feedrank/common/time.hpp"
#include "feedrank/ranking/feed_json.hpp"
#include "feedrank/ranking/home_mixer.hpp"
#include "feedrank/ranking/news_source.hpp"
#include "feedrank/ranking/trends.hpp"
#include "feedrank/store/sqlite_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <set>

namespace {

namespace rk = feedrank::ranking;
namespace st = feedrank::store;
namespace t = feedrank::testing;
using feedrank::tests::require;

void must(const feedrank::common::Status &status) { require(status.ok(), status.error()); }

// A small social graph: the viewer follows two prolific authors; three strangers post
// originals, one with heavy engagement.
void seed_graph(st::IStore &store) {
  must(store.add_user(t::make_user("viewer", {"alice", "bob"})));
  for (const auto *id : {"alice", "bob", "carol", "dave", "erin"}) {
    must(store.add_user(t::make_user(id)));
  }

  const std::vector<st::Topic> tech = {st::Topic::Tech};
  const std::vector<st::Topic> memes = {st::Topic::Memes};
  for (int i = 0; i < 4; ++i) {
    must(store.add_post(t::make_post("alice_" + std::to_string(i), "alice", 600.0 * (i + 1), tech)));
    must(store.add_post(t::make_post("bob_" + std::to_string(i), "bob", 900.0 * (i + 1), memes)));
  }
  must(store.add_post(t::make_post("carol_viral", "carol", 5400.0, tech)));
  must(store.add_post(t::make_post("dave_quiet", "dave", 1800.0, {st::Topic::Finance})));
  must(store.add_post(t::make_post("erin_old", "erin", 3600.0 * 200, memes)));
  must(store.add_post(t::make_post("viewer_own", "viewer", 60.0, tech)));

  auto reply = t::make_post("bob_reply", "bob", 300.0);
  reply.type = st::PostType::Reply;
  reply.parent_id = "carol_viral";
  must(store.add_post(reply));

  t::add_engagements(store, "carol_viral", st::EngagementType::Like, 40);
  t::add_engagements(store, "carol_viral", st::EngagementType::Repost, 12);
  t::add_engagements(store, "alice_0", st::EngagementType::Reply, 3);
}

std::vector<std::string> feed_ids(const rk::FeedResponse &response) {
  std::vector<std::string> out;
  for (const auto &item : response.items) {
    out.push_back(item.post.post.id);
  }
  return out;
}

} // namespace

void register_feed_integration_tests(std::vector<feedrank::tests::TestCase> &tests) {
  tests.push_back({"integration_sqlite_feed_end_to_end", [] {
                     t::TempWorkspace workspace;
                     st::SqliteStore store(workspace.path() / "feed.db", 86400.0 * 14,
                                           feedrank::common::fixed_clock(t::kNow));
                     require(store.health_check(), "store did not open");
                     seed_graph(store);

                     rk::HomeMixer mixer(store, {}, feedrank::common::fixed_clock(t::kNow));
                     rk::FeedRequest request;
                     request.user_id = "viewer";
                     request.limit = 10;
                     const auto response = mixer.get_feed(request);

                     require(response.items.size() == 10, "expected a full page");
                     std::set<std::string> ids;
                     for (const auto &item : response.items) {
                       require(ids.insert(item.post.post.id).second, "duplicate post in feed");
                       require(item.post.post.author_id != "viewer", "self post surfaced");
                       require(item.post.post.id != "erin_old", "post outside max age surfaced");
                       require(item.explanation.has_value(), "explanation missing");
                       require(rk::reconstruct_score(*item.explanation) == item.explanation->final_score,
                               "explanation does not reconstruct the score");
                     }

                     const auto &top_three = response.items;
                     require(top_three[0].post.post.author_id != top_three[1].post.post.author_id ||
                                 top_three[1].post.post.author_id != top_three[2].post.post.author_id,
                             "top of feed should not be a single author");

                     for (const auto &item : response.items) {
                       if (item.post.post.id == "bob_reply") {
                         require(item.parent_post.has_value() &&
                                     item.parent_post->post.id == "carol_viral",
                                 "reply parent not hydrated");
                       }
                       if (item.post.post.id == "carol_viral") {
                         require(item.post.post.like_count == 40 && item.post.post.repost_count == 12,
                                 "live counts not hydrated");
                         require(item.explanation->source == rk::CandidateSource::OutOfNetwork,
                                 "stranger post should be out-of-network");
                       }
                     }

                     const auto json = rk::feed_to_json(response);
                     require(json.find("\"final_score\":") != std::string::npos, "scores not serialized");
                     require(json.find("\"probabilities\":{\"like\":") != std::string::npos,
                             "probabilities not serialized");
                   }});

  tests.push_back({"integration_memory_and_sqlite_rank_identically", [] {
                     auto memory = t::make_store();
                     seed_graph(*memory);

                     t::TempWorkspace workspace;
                     st::SqliteStore sqlite(workspace.path() / "feed.db", 86400.0 * 7,
                                            feedrank::common::fixed_clock(t::kNow));
                     seed_graph(sqlite);

                     rk::FeedRequest request;
                     request.user_id = "viewer";
                     rk::HomeMixer memory_mixer(*memory, {}, feedrank::common::fixed_clock(t::kNow));
                     rk::HomeMixer sqlite_mixer(sqlite, {}, feedrank::common::fixed_clock(t::kNow));
                     const auto from_memory = memory_mixer.get_feed(request);
                     const auto from_sqlite = sqlite_mixer.get_feed(request);
                     require(feed_ids(from_memory) == feed_ids(from_sqlite), "backends disagree on order");
                     require(rk::feed_to_json(from_memory) == rk::feed_to_json(from_sqlite),
                             "backends disagree on serialized output");
                   }});

  tests.push_back({"integration_news_source_joins_feed", [] {
                     auto store = t::make_store();
                     seed_graph(*store);

                     auto http = std::make_shared<t::StubHttpClient>();
                     http->set_response(200, R"({"status":"ok","articles":[
                       {"source":{"name":"Wire"},"title":"Launch day","description":"Rocket lifts off",
                        "url":"https://example.com/launch","publishedAt":"2024-05-01T11:58:00Z"}]})");
                     feedrank::config::NewsConfig news;
                     news.enabled = true;
                     news.api_key = "key";
                     news.category = "science";

                     rk::HomeMixer mixer(*store, {}, feedrank::common::fixed_clock(t::kNow));
                     mixer.set_external_source(std::make_shared<rk::NewsApiSource>(
                         news, http, feedrank::common::fixed_clock(t::kNow)));
                     rk::FeedRequest request;
                     request.user_id = "viewer";
                     const auto response = mixer.get_feed(request);

                     const std::string news_id = rk::news_post_id("https://example.com/launch");
                     bool found = false;
                     for (const auto &item : response.items) {
                       if (item.post.post.id == news_id) {
                         found = true;
                         require(item.post.author.has_value() && item.post.author->display_name == "Wire",
                                 "news author missing");
                         require(item.post.post.topics == std::vector<st::Topic>{st::Topic::Tech},
                                 "science should map to tech");
                       }
                     }
                     require(found, "news item missing from feed");

                     http->set_network_error("offline");
                     const auto degraded = mixer.get_feed(request);
                     for (const auto &item : degraded.items) {
                       require(item.post.post.id != news_id, "news item survived an outage");
                     }
                     require(!degraded.items.empty(), "outage must not empty the feed");
                   }});

  tests.push_back({"integration_trending_topics", [] {
                     auto store = t::make_store();
                     seed_graph(*store);
                     const auto trends = rk::trending_topics(*store, 24.0, 2);
                     require(trends.size() == 2, "limit not applied");
                     require(trends[0].topic == "tech" && trends[0].count == 6, "tech should lead");
                     require(trends[1].topic == "memes" && trends[1].count == 4, "memes should follow");
                   }});
}
