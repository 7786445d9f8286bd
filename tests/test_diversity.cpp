#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "feedrank/ranking/diversity.hpp"

namespace {

namespace rk = feedrank::ranking;
namespace t = feedrank::testing;

// A scored candidate whose explanation reconstructs to `score` before diversity.
rk::ScoredCandidate scored(const std::string &id, const std::string &author, double score) {
  rk::ScoredCandidate out;
  out.candidate = t::make_candidate(id, author, 60.0);
  out.explanation.post_id = id;
  out.explanation.breakdown.in_network_multiplier = 1.0;
  out.explanation.action_scores.push_back(rk::ActionScore{
      .action = rk::Action::Like, .weight = 1.0, .probability = score, .contribution = score});
  out.final_score = rk::pre_diversity_score(out.explanation);
  out.explanation.final_score = out.final_score;
  return out;
}

} // namespace

void register_diversity_tests(std::vector<feedrank::tests::TestCase> &tests) {
  using feedrank::tests::require;
  using feedrank::tests::require_near;

  tests.push_back({"diversity_penalty_grows_with_occurrence", [] {
                     require(rk::diversity_penalty(1, 0.6) == 0.0, "first post is free");
                     require_near(rk::diversity_penalty(2, 0.6), 0.09, "second post", 1e-12);
                     require_near(rk::diversity_penalty(3, 0.6), 0.18, "third post", 1e-12);
                     require(rk::diversity_penalty(5, 0.0) == 0.0, "zero strength disables penalty");
                   }});

  tests.push_back({"diversity_demotes_repeat_authors", [] {
                     rk::AlgorithmPreferences prefs;
                     prefs.diversity_strength = 1.0;
                     std::vector<rk::ScoredCandidate> input = {
                         scored("a1", "a", 1.00), scored("a2", "a", 0.95), scored("b1", "b", 0.90)};
                     const auto out = rk::apply_author_diversity(input, prefs);
                     require(out.size() == 3, "nothing should be dropped");
                     require(out[0].candidate.post.id == "a1" && out[1].candidate.post.id == "b1",
                             "repeat author should fall behind b1");
                     require_near(out[2].final_score, 0.80, "a2 penalized by 0.15", 1e-12);
                     for (std::size_t i = 0; i < out.size(); ++i) {
                       require(out[i].explanation.rank == i + 1, "ranks must be 1..n");
                       require(out[i].explanation.final_score == out[i].final_score,
                               "explanation score out of sync");
                       require(rk::reconstruct_score(out[i].explanation) == out[i].final_score,
                               "reconstruction broken by diversity");
                     }
                   }});

  tests.push_back({"diversity_never_pushes_below_zero", [] {
                     rk::AlgorithmPreferences prefs;
                     prefs.diversity_strength = 1.0;
                     std::vector<rk::ScoredCandidate> input = {scored("a1", "a", 0.5), scored("a2", "a", 0.1),
                                                               scored("a3", "a", 0.05),
                                                               scored("a4", "a", -0.2)};
                     const auto out = rk::apply_author_diversity(input, prefs);
                     for (const auto &item : out) {
                       const double before = rk::pre_diversity_score(item.explanation);
                       require(item.final_score >= 0.0, "score below zero after diversity");
                       if (before >= 0.0) {
                         require(item.final_score <= before, "diversity raised a positive score");
                       }
                       require(item.explanation.breakdown.diversity_reduction <=
                                   item.explanation.diversity_penalty,
                               "applied reduction exceeds nominal penalty");
                       require(rk::reconstruct_score(item.explanation) == item.final_score,
                               "reconstruction mismatch");
                     }
                     const auto &a2 = out[1];
                     require(a2.candidate.post.id == "a2" && a2.final_score == 0.0,
                             "a2 should clamp to zero");
                     require_near(a2.explanation.diversity_penalty, 0.15,
                                  "nominal penalty should still be reported", 1e-12);
                   }});

  tests.push_back({"diversity_floors_negative_first_post_at_zero", [] {
                     rk::AlgorithmPreferences prefs;
                     prefs.diversity_strength = 0.5;
                     std::vector<rk::ScoredCandidate> input = {scored("b1", "b", 0.3),
                                                               scored("a1", "a", -0.343033)};
                     const auto out = rk::apply_author_diversity(input, prefs);
                     require(out.size() == 2, "nothing should be dropped");
                     require(out[0].candidate.post.id == "b1" && out[1].candidate.post.id == "a1",
                             "order should follow the pre-diversity scores");
                     const auto &a1 = out[1];
                     require(a1.final_score == 0.0, "negative score should floor at zero");
                     require(a1.explanation.final_score == 0.0, "explanation score out of sync");
                     require(a1.explanation.diversity_penalty == 0.0, "first post carries no penalty");
                     require(a1.explanation.breakdown.diversity_reduction == -0.343033,
                             "reduction should record the lift to zero");
                     require(rk::reconstruct_score(a1.explanation) == a1.final_score,
                             "reconstruction mismatch after floor");
                   }});

  tests.push_back({"diversity_is_monotone_in_strength", [] {
                     const std::vector<rk::ScoredCandidate> input = {
                         scored("a1", "a", 1.0), scored("a2", "a", 0.9), scored("a3", "a", 0.8),
                         scored("b1", "b", 0.7)};
                     double previous_total = 1e9;
                     for (const double strength : {0.0, 0.3, 0.6, 1.0}) {
                       rk::AlgorithmPreferences prefs;
                       prefs.diversity_strength = strength;
                       double total = 0.0;
                       for (const auto &item : rk::apply_author_diversity(input, prefs)) {
                         total += item.final_score;
                       }
                       require(total <= previous_total, "stronger diversity raised scores");
                       previous_total = total;
                     }
                   }});

  tests.push_back({"diversity_keeps_order_for_equal_scores", [] {
                     rk::AlgorithmPreferences prefs;
                     prefs.diversity_strength = 0.0;
                     std::vector<rk::ScoredCandidate> input = {scored("x", "a", 0.5), scored("y", "b", 0.5),
                                                               scored("z", "c", 0.5)};
                     const auto out = rk::apply_author_diversity(input, prefs);
                     require(out[0].candidate.post.id == "x" && out[1].candidate.post.id == "y" &&
                                 out[2].candidate.post.id == "z",
                             "stable ordering lost");
                     require(rk::apply_author_diversity({}, prefs).empty(), "empty input");
                   }});
}
