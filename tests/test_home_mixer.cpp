#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "feedrank/common/time.hpp"
#include "feedrank/ranking/home_mixer.hpp"

#include <set>
#include <unordered_set>

namespace {

namespace rk = feedrank::ranking;
namespace st = feedrank::store;
namespace t = feedrank::testing;
using feedrank::tests::require;

void must(const feedrank::common::Status &status) { require(status.ok(), status.error()); }

rk::HomeMixer make_mixer(st::IReadStore &store) {
  return rk::HomeMixer(store, {}, feedrank::common::fixed_clock(t::kNow));
}

// u0 follows u1..u5; each author has two posts a minute apart, authors two minutes apart.
std::unique_ptr<st::MemoryStore> five_author_store() {
  auto store = t::make_store();
  must(store->add_user(t::make_user("u0", {"u1", "u2", "u3", "u4", "u5"})));
  for (int author = 1; author <= 5; ++author) {
    const std::string id = "u" + std::to_string(author);
    must(store->add_user(t::make_user(id)));
    const double base_age = 3600.0 + (author - 1) * 120.0;
    must(store->add_post(t::make_post(id + "_a", id, base_age)));
    must(store->add_post(t::make_post(id + "_b", id, base_age + 60.0)));
  }
  return store;
}

class FakeNews final : public rk::IExternalSource {
public:
  [[nodiscard]] std::string_view name() const override { return "fake_news"; }
  [[nodiscard]] bool available() const override { return true; }
  [[nodiscard]] std::vector<rk::Candidate> fetch(std::size_t) override {
    auto candidate = t::make_candidate("news_1", "news_api", 30.0, rk::CandidateSource::OutOfNetwork);
    st::User author;
    author.id = "news_api";
    author.display_name = "Wire";
    candidate.author = author;
    return {candidate};
  }
};

} // namespace

void register_home_mixer_tests(std::vector<feedrank::tests::TestCase> &tests) {
  tests.push_back({"home_mixer_top_items_have_distinct_authors", [] {
                     auto store = five_author_store();
                     auto mixer = make_mixer(*store);
                     rk::FeedRequest request;
                     request.user_id = "u0";
                     request.limit = 5;
                     const auto response = mixer.get_feed(request);

                     require(response.items.size() == 5, "expected five items");
                     std::set<std::string> top_three;
                     for (std::size_t i = 0; i < 3; ++i) {
                       top_three.insert(response.items[i].post.post.author_id);
                     }
                     require(top_three.size() == 3, "top three items share an author");
                     require(response.items[0].post.post.id == "u1_a", "freshest post should lead");
                     for (std::size_t i = 0; i < response.items.size(); ++i) {
                       require(response.items[i].explanation.has_value(), "explanation missing");
                       require(response.items[i].explanation->rank == i + 1, "rank mismatch");
                       if (i > 0) {
                         require(response.items[i - 1].explanation->final_score >=
                                     response.items[i].explanation->final_score,
                                 "items not in descending score order");
                       }
                     }
                     require(!response.next_cursor.has_value(), "cursor should be absent");
                   }});

  tests.push_back({"home_mixer_following_only_with_empty_following_is_empty", [] {
                     auto store = t::make_store();
                     must(store->add_user(t::make_user("lonely")));
                     must(store->add_user(t::make_user("stranger")));
                     must(store->add_post(t::make_post("s1", "stranger", 60.0)));
                     auto mixer = make_mixer(*store);
                     mixer.set_external_source(std::make_shared<FakeNews>());

                     rk::FeedRequest request;
                     request.user_id = "lonely";
                     request.following_only = true;
                     require(mixer.get_feed(request).items.empty(),
                             "following tab must not fall back to out-of-network");

                     request.following_only = false;
                     require(!mixer.get_feed(request).items.empty(), "for you should use the global pool");
                   }});

  tests.push_back({"home_mixer_following_only_uses_its_own_limit", [] {
                     auto store = five_author_store();
                     rk::MixerOptions options;
                     options.limits.limit_in_network = 2;
                     options.following_only_limit = 8;
                     rk::HomeMixer mixer(*store, options, feedrank::common::fixed_clock(t::kNow));

                     rk::FeedRequest request;
                     request.user_id = "u0";
                     request.following_only = true;
                     request.limit = 50;
                     require(mixer.get_feed(request).items.size() == 8, "following_only_limit ignored");
                     request.following_only = false;
                     require(mixer.get_feed(request).items.size() == 2, "limit_in_network ignored");
                   }});

  tests.push_back({"home_mixer_never_returns_self_or_seen_posts", [] {
                     auto store = five_author_store();
                     must(store->add_post(t::make_post("own", "u0", 10.0)));
                     auto mixer = make_mixer(*store);

                     rk::FeedRequest request;
                     request.user_id = "u0";
                     request.seen_post_ids = {"u1_a", "u2_b"};
                     const auto response = mixer.get_feed(request);
                     require(response.items.size() == 8, "expected the eight unseen posts");
                     for (const auto &item : response.items) {
                       require(item.post.post.author_id != "u0", "self post surfaced");
                       require(!request.seen_post_ids.contains(item.post.post.id), "seen post surfaced");
                     }
                   }});

  tests.push_back({"home_mixer_is_deterministic_for_fixed_inputs", [] {
                     auto store = five_author_store();
                     auto mixer = make_mixer(*store);
                     rk::FeedRequest request;
                     request.user_id = "u0";
                     const auto first = mixer.get_feed(request);
                     const auto second = mixer.get_feed(request);
                     require(first.items.size() == second.items.size(), "size changed");
                     for (std::size_t i = 0; i < first.items.size(); ++i) {
                       require(first.items[i].post.post.id == second.items[i].post.post.id, "order changed");
                       require(first.items[i].explanation->final_score ==
                                   second.items[i].explanation->final_score,
                               "score changed");
                     }
                   }});

  tests.push_back({"home_mixer_explanations_do_not_change_ranking", [] {
                     auto store = five_author_store();
                     t::add_engagements(*store, "u3_b", st::EngagementType::Like, 4);
                     auto mixer = make_mixer(*store);
                     rk::FeedRequest request;
                     request.user_id = "u0";
                     request.include_explanations = true;
                     const auto explained = mixer.get_feed(request);
                     request.include_explanations = false;
                     const auto plain = mixer.get_feed(request);

                     require(!explained.items.empty(), "feed should not be empty");
                     require(explained.items.size() == plain.items.size(), "item count changed");
                     for (std::size_t i = 0; i < plain.items.size(); ++i) {
                       require(explained.items[i].explanation.has_value(), "explanation missing");
                       require(!plain.items[i].explanation.has_value(), "explanation not requested");
                       require(explained.items[i].post.post.id == plain.items[i].post.post.id,
                               "order changed at position " + std::to_string(i));
                     }
                   }});

  tests.push_back({"home_mixer_floors_negative_scores_at_zero", [] {
                     auto store = t::make_store();
                     must(store->add_user(t::make_user("viewer", {"old"})));
                     must(store->add_user(t::make_user("old")));
                     must(store->add_post(t::make_post("stale", "old", 167.0 * 3600.0, {st::Topic::Politics})));

                     auto mixer = make_mixer(*store);
                     rk::FeedRequest request;
                     request.user_id = "viewer";
                     rk::AlgorithmPreferences prefs;
                     prefs.negative_signal_strength = 1.0;
                     prefs.recency_vs_popularity = 0.0;
                     request.preferences = prefs;
                     const auto response = mixer.get_feed(request);

                     require(response.items.size() == 1, "stale post should still be served");
                     const auto &explanation = response.items[0].explanation;
                     require(explanation.has_value(), "explanation missing");
                     require(explanation->final_score == 0.0, "negative score should report as zero");
                     require(explanation->breakdown.diversity_reduction < 0.0,
                             "reduction should record the lift from a negative score");
                     require(rk::pre_diversity_score(*explanation) < 0.0, "pre-diversity score should be negative");
                     require(rk::reconstruct_score(*explanation) == explanation->final_score,
                             "reconstruction mismatch");
                   }});

  tests.push_back({"home_mixer_hydrates_authors_counts_and_references", [] {
                     auto store = t::make_store();
                     must(store->add_user(t::make_user("viewer", {"a"})));
                     must(store->add_user(t::make_user("a")));
                     must(store->add_user(t::make_user("b")));
                     must(store->add_post(t::make_post("root", "b", 600.0)));
                     auto reply = t::make_post("reply", "a", 60.0);
                     reply.type = st::PostType::Reply;
                     reply.parent_id = "root";
                     reply.like_count = 999;
                     must(store->add_post(reply));
                     auto quote = t::make_post("quote", "a", 120.0);
                     quote.type = st::PostType::Quote;
                     quote.quoted_id = "deleted";
                     must(store->add_post(quote));
                     t::add_engagements(*store, "reply", st::EngagementType::Like, 3);

                     auto mixer = make_mixer(*store);
                     rk::FeedRequest request;
                     request.user_id = "viewer";
                     request.include_explanations = false;
                     const auto response = mixer.get_feed(request);

                     const rk::FeedItem *reply_item = nullptr;
                     const rk::FeedItem *quote_item = nullptr;
                     for (const auto &item : response.items) {
                       require(!item.explanation.has_value(), "explanations were not requested");
                       if (item.post.post.id == "reply") {
                         reply_item = &item;
                       } else if (item.post.post.id == "quote") {
                         quote_item = &item;
                       }
                     }
                     require(reply_item != nullptr && quote_item != nullptr, "in-network posts missing");
                     require(reply_item->post.post.like_count == 3, "counts should come from engagements");
                     require(reply_item->post.author.has_value() && reply_item->post.author->id == "a",
                             "author not hydrated");
                     require(reply_item->parent_post.has_value() &&
                                 reply_item->parent_post->post.id == "root" &&
                                 reply_item->parent_post->author.has_value(),
                             "parent not hydrated");
                     require(!quote_item->quoted_post.has_value(), "missing quoted post should be absent");
                   }});

  tests.push_back({"home_mixer_merges_external_candidates", [] {
                     auto store = five_author_store();
                     auto mixer = make_mixer(*store);
                     mixer.set_external_source(std::make_shared<FakeNews>());
                     rk::FeedRequest request;
                     request.user_id = "u0";
                     const auto response = mixer.get_feed(request);
                     bool found = false;
                     for (const auto &item : response.items) {
                       if (item.post.post.id == "news_1") {
                         found = true;
                         require(item.post.author.has_value() && item.post.author->display_name == "Wire",
                                 "candidate author should be used when the store has none");
                         require(item.explanation->source == rk::CandidateSource::OutOfNetwork,
                                 "external items are out-of-network");
                       }
                     }
                     require(found, "external candidate missing");
                   }});

  tests.push_back({"home_mixer_records_pipeline_events", [] {
                     auto store = five_author_store();
                     const t::ObserverCapture capture;
                     auto mixer = make_mixer(*store);
                     rk::FeedRequest request;
                     request.user_id = "u0";
                     request.limit = 3;
                     (void)mixer.get_feed(request);

                     namespace obs = feedrank::observability;
                     require(!capture.events().empty(), "no events recorded");
                     const auto *started = std::get_if<obs::FeedRequestEvent>(&capture.events().front());
                     require(started != nullptr && started->limit == 3, "request event missing");
                     std::vector<std::string> stages;
                     for (const auto &event : capture.events()) {
                       if (const auto *stage = std::get_if<obs::PipelineStageEvent>(&event)) {
                         stages.push_back(stage->stage);
                       }
                     }
                     require(stages == std::vector<std::string>({"sourced", "filtered", "scored"}),
                             "stage sequence mismatch");
                     const auto *served = std::get_if<obs::FeedServedEvent>(&capture.events().back());
                     require(served != nullptr && served->items == 3, "served event missing");
                   }});

  tests.push_back({"home_mixer_options_from_config", [] {
                     feedrank::config::RankingConfig ranking;
                     ranking.limit_oon = 9;
                     ranking.following_only_limit = 11;
                     ranking.max_age_hours = 24.0;
                     ranking.external_limit = 4;
                     const auto options = rk::mixer_options_from_config(ranking);
                     require(options.limits.limit_oon == 9, "limit_oon");
                     require(options.following_only_limit == 11, "following_only_limit");
                     require(options.max_age_hours == 24.0, "max_age_hours");
                     require(options.external_limit == 4, "external_limit");
                   }});
}
