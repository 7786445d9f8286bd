#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "feedrank/common/time.hpp"
#include "feedrank/store/sqlite_store.hpp"

#include <iostream>
#include <sstream>

namespace {

namespace st = feedrank::store;
namespace t = feedrank::testing;
using feedrank::tests::require;

void must(const feedrank::common::Status &status) { require(status.ok(), status.error()); }

struct CoutCapture {
  std::ostringstream buffer;
  std::streambuf *old = nullptr;

  CoutCapture() : old(std::cout.rdbuf(buffer.rdbuf())) {}
  ~CoutCapture() { std::cout.rdbuf(old); }
};

// Writes a config pointing at a sqlite file inside the workspace.
void write_config(const t::TempWorkspace &workspace, const std::string &backend = "sqlite") {
  workspace.create_file("config.toml", "[store]\n"
                                       "backend = \"" +
                                           backend +
                                           "\"\n"
                                           "path = \"" +
                                           (workspace.path() / "feed.db").string() +
                                           "\"\n"
                                           "[observability]\n"
                                           "backend = \"none\"\n");
}

// The CLI reads with the system clock, so seed relative to the real time.
void seed(const t::TempWorkspace &workspace) {
  const double now = feedrank::common::unix_now();
  st::SqliteStore store(workspace.path() / "feed.db");
  must(store.add_user(t::make_user("u0", {"u1"})));
  must(store.add_user(t::make_user("u1")));
  must(store.add_user(t::make_user("u2")));

  auto followed = t::make_post("p_in", "u1", 0.0, {st::Topic::Tech});
  followed.created_at = now - 300.0;
  must(store.add_post(followed));
  auto stranger = t::make_post("p_out", "u2", 0.0, {st::Topic::Tech});
  stranger.created_at = now - 600.0;
  must(store.add_post(stranger));
  auto dismissed = t::make_post("p_hidden", "u2", 0.0, {st::Topic::Memes});
  dismissed.created_at = now - 120.0;
  must(store.add_post(dismissed));
  must(store.add_engagement(st::Engagement{.user_id = "u0",
                                           .post_id = "p_hidden",
                                           .type = st::EngagementType::NotInterested,
                                           .created_at = now}));

  feedrank::ranking::AlgorithmPreferences prefs;
  prefs.friends_vs_global = 1.0;
  must(store.put_preferences("u0", prefs));
}

} // namespace

void register_cli_tests(std::vector<feedrank::tests::TestCase> &tests) {
  tests.push_back({"cli_version_help_and_unknown", [] {
                     const CoutCapture capture;
                     require(t::run_cli({"feedrank", "version"}) == 0, "version should succeed");
                     require(capture.buffer.str().find("feedrank ") == 0, "version text missing");
                     require(t::run_cli({"feedrank", "help"}) == 0, "help should succeed");
                     require(t::run_cli({"feedrank"}) == 0, "no args prints help");
                     require(t::run_cli({"feedrank", "frobnicate"}) == 1, "unknown command should fail");
                   }});

  tests.push_back({"cli_config_path_honours_flag", [] {
                     t::TempWorkspace workspace;
                     const t::ConfigOverrideGuard guard;
                     const auto path = (workspace.path() / "alt.toml").string();
                     const CoutCapture capture;
                     require(t::run_cli({"feedrank", "--config", path, "config-path"}) == 0,
                             "config-path should succeed");
                     require(capture.buffer.str() == path + "\n", "unexpected path: " + capture.buffer.str());
                     require(t::run_cli({"feedrank", "config-path", "--config"}) == 1,
                             "missing --config value should fail");
                   }});

  tests.push_back({"cli_feed_usage_errors", [] {
                     t::TempWorkspace workspace;
                     const t::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     write_config(workspace, "memory");
                     require(t::run_cli({"feedrank", "feed"}) == 2, "missing user id");
                     require(t::run_cli({"feedrank", "feed", "a", "b"}) == 2, "two user ids");
                     require(t::run_cli({"feedrank", "feed", "u0", "--limit", "many"}) == 2, "bad limit");
                     require(t::run_cli({"feedrank", "trends", "--hours", "-1"}) == 2, "bad hours");
                   }});

  tests.push_back({"cli_feed_unknown_user_fails", [] {
                     t::TempWorkspace workspace;
                     const t::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     const t::EnvGuard store_path("FEEDRANK_STORE_PATH", std::nullopt);
                     write_config(workspace, "memory");
                     require(t::run_cli({"feedrank", "feed", "nobody"}) == 1, "unknown user should fail");
                   }});

  tests.push_back({"cli_feed_prints_ranked_json", [] {
                     t::TempWorkspace workspace;
                     const t::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     const t::EnvGuard store_path("FEEDRANK_STORE_PATH", std::nullopt);
                     write_config(workspace);
                     seed(workspace);

                     const CoutCapture capture;
                     require(t::run_cli({"feedrank", "feed", "u0", "--limit", "5"}) == 0,
                             "feed should succeed");
                     const std::string out = capture.buffer.str();
                     require(out.rfind("{\"items\":[", 0) == 0, "unexpected output: " + out);
                     require(out.find("\"p_in\"") != std::string::npos, "in-network post missing");
                     require(out.find("\"p_out\"") != std::string::npos, "out-of-network post missing");
                     require(out.find("\"p_hidden\"") == std::string::npos,
                             "not_interested post should be hidden");
                     require(out.find("\"ranking_explanation\":{") != std::string::npos,
                             "explanations missing");
                     require(out.find("\"next_cursor\":null") != std::string::npos, "cursor missing");
                   }});

  tests.push_back({"cli_feed_flags", [] {
                     t::TempWorkspace workspace;
                     const t::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     const t::EnvGuard store_path("FEEDRANK_STORE_PATH", std::nullopt);
                     write_config(workspace);
                     seed(workspace);

                     {
                       const CoutCapture capture;
                       require(t::run_cli({"feedrank", "feed", "u0", "--following", "--no-explain"}) == 0,
                               "following feed should succeed");
                       const std::string out = capture.buffer.str();
                       require(out.find("\"p_out\"") == std::string::npos,
                               "following tab leaked out-of-network");
                       require(out.find("\"ranking_explanation\":null") != std::string::npos,
                               "explanations should be omitted");
                     }
                     {
                       const CoutCapture capture;
                       require(t::run_cli({"feedrank", "feed", "u0", "--seen", "p_in,p_x"}) == 0,
                               "seen feed should succeed");
                       require(capture.buffer.str().find("\"p_in\"") == std::string::npos,
                               "seen post surfaced");
                     }
                     {
                       const CoutCapture capture;
                       require(t::run_cli({"feedrank", "feed", "u0", "--prefs-from-store"}) == 0,
                               "stored preferences should load");
                     }
                   }});

  tests.push_back({"cli_prefs_from_store_needs_sqlite", [] {
                     t::TempWorkspace workspace;
                     const t::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     write_config(workspace, "memory");
                     require(t::run_cli({"feedrank", "feed", "u0", "--prefs-from-store"}) == 1,
                             "memory backend has no stored users");
                   }});

  tests.push_back({"cli_trends_prints_topic_counts", [] {
                     t::TempWorkspace workspace;
                     const t::ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     const t::EnvGuard store_path("FEEDRANK_STORE_PATH", std::nullopt);
                     write_config(workspace);
                     seed(workspace);

                     const CoutCapture capture;
                     require(t::run_cli({"feedrank", "trends", "--limit", "1"}) == 0, "trends should succeed");
                     require(capture.buffer.str() == "[{\"topic\":\"tech\",\"count\":2}]\n",
                             "unexpected trends output: " + capture.buffer.str());
                   }});
}
