#include "feedrank/cli/commands.hpp"

#include "feedrank/common/fs.hpp"
#include "feedrank/config/config.hpp"
#include "feedrank/net/http.hpp"
#include "feedrank/observability/factory.hpp"
#include "feedrank/observability/global.hpp"
#include "feedrank/ranking/feed_json.hpp"
#include "feedrank/ranking/home_mixer.hpp"
#include "feedrank/ranking/news_source.hpp"
#include "feedrank/ranking/trends.hpp"
#include "feedrank/store/memory_store.hpp"
#include "feedrank/store/sqlite_store.hpp"

#include <charconv>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace feedrank::cli {

namespace {

constexpr std::size_t kNegativeHistoryLimit = 100;

std::string version_string() {
#ifdef FEEDRANK_VERSION
  std::string version = FEEDRANK_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "feedrank " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

template <typename Number> bool parse_number(const std::string &raw, Number &out) {
  const std::string value = common::trim(raw);
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  return ec == std::errc() && ptr == value.data() + value.size() && !value.empty();
}

// Loads config, reports validation warnings and installs the configured observer.
common::Result<config::Config> prepare_config() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  const auto validation = config::validate_config(loaded.value());
  if (!validation.ok()) {
    return common::Result<config::Config>::failure("invalid config: " + validation.error());
  }
  for (const auto &warning : validation.value()) {
    std::cerr << "[WARN] " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));
  return loaded;
}

common::Result<std::unique_ptr<store::IStore>> open_store(const config::Config &config) {
  using ResultType = common::Result<std::unique_ptr<store::IStore>>;
  const double retention_seconds = config.store.retention_hours * 3600.0;
  if (common::to_lower(config.store.backend) == "memory") {
    return ResultType::success(std::make_unique<store::MemoryStore>(retention_seconds));
  }

  auto sqlite = std::make_unique<store::SqliteStore>(common::expand_path(config.store.path),
                                                     retention_seconds);
  if (!sqlite->health_check()) {
    return ResultType::failure("unable to open store at " + sqlite->path().string());
  }
  return ResultType::success(std::move(sqlite));
}

int run_feed(std::vector<std::string> args) {
  std::string limit_raw;
  std::string seen_raw;
  const bool following_only = take_flag(args, "--following");
  const bool no_explain = take_flag(args, "--no-explain");
  const bool prefs_from_store = take_flag(args, "--prefs-from-store");
  const bool has_limit = take_option(args, "--limit", "-n", limit_raw);
  (void)take_option(args, "--seen", "", seen_raw);

  if (args.size() != 1) {
    std::cerr << "usage: feedrank feed <user_id> [--limit N] [--following] [--no-explain] "
                 "[--seen id,id] [--prefs-from-store]\n";
    return 2;
  }
  const std::string user_id = args.front();

  auto config_result = prepare_config();
  if (!config_result.ok()) {
    std::cerr << config_result.error() << "\n";
    return 1;
  }
  const auto &config = config_result.value();

  std::size_t limit = config.ranking.default_limit;
  if (has_limit && !parse_number(limit_raw, limit)) {
    std::cerr << "invalid --limit: " << limit_raw << "\n";
    return 2;
  }

  auto store_result = open_store(config);
  if (!store_result.ok()) {
    std::cerr << store_result.error() << "\n";
    return 1;
  }
  auto &store = *store_result.value();

  if (!store.get_user(user_id).has_value()) {
    std::cerr << "user not found: " << user_id << "\n";
    return 1;
  }

  ranking::FeedRequest request;
  request.user_id = user_id;
  request.limit = limit;
  request.following_only = following_only;
  request.include_explanations = !no_explain;
  request.preferences = config.preferences;
  for (const auto &id : common::split(seen_raw, ',')) {
    request.seen_post_ids.insert(id);
  }
  for (const auto &id : store.get_negative_engagement_post_ids(user_id, kNegativeHistoryLimit)) {
    request.seen_post_ids.insert(id);
  }

  if (prefs_from_store) {
    auto *sqlite = dynamic_cast<store::SqliteStore *>(&store);
    if (sqlite == nullptr) {
      std::cerr << "--prefs-from-store requires the sqlite store backend\n";
      return 1;
    }
    const auto stored = sqlite->get_preferences(user_id);
    if (!stored.ok()) {
      std::cerr << "failed to read preferences: " << stored.error() << "\n";
      return 1;
    }
    if (stored.value().has_value()) {
      request.preferences = *stored.value();
    }
  }

  ranking::HomeMixer mixer(store, ranking::mixer_options_from_config(config.ranking));
  if (config.news.enabled) {
    mixer.set_external_source(std::make_shared<ranking::NewsApiSource>(
        config.news, std::make_shared<net::CurlHttpClient>()));
  }

  const auto response = mixer.get_feed(request);
  std::cout << ranking::feed_to_json(response) << "\n";

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_trends(std::vector<std::string> args) {
  std::string limit_raw;
  std::string hours_raw;
  const bool has_limit = take_option(args, "--limit", "-n", limit_raw);
  const bool has_hours = take_option(args, "--hours", "", hours_raw);
  if (!args.empty()) {
    std::cerr << "usage: feedrank trends [--limit N] [--hours H]\n";
    return 2;
  }

  std::size_t limit = 20;
  double hours = 24.0;
  if (has_limit && !parse_number(limit_raw, limit)) {
    std::cerr << "invalid --limit: " << limit_raw << "\n";
    return 2;
  }
  if (has_hours && (!parse_number(hours_raw, hours) || hours <= 0.0)) {
    std::cerr << "invalid --hours: " << hours_raw << "\n";
    return 2;
  }

  auto config_result = prepare_config();
  if (!config_result.ok()) {
    std::cerr << config_result.error() << "\n";
    return 1;
  }
  auto store_result = open_store(config_result.value());
  if (!store_result.ok()) {
    std::cerr << store_result.error() << "\n";
    return 1;
  }

  std::cout << ranking::topic_counts_to_json(
                   ranking::trending_topics(*store_result.value(), hours, limit))
            << "\n";
  return 0;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: feedrank [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  feed <user_id>   Rank the For You feed for a user and print it as JSON\n";
  std::cout << "      --limit N          number of items (default from [ranking] default_limit)\n";
  std::cout << "      --following        Following tab: in-network posts only\n";
  std::cout << "      --no-explain       omit ranking explanations\n";
  std::cout << "      --seen id,id       hide these post ids\n";
  std::cout << "      --prefs-from-store use the user's stored preferences (sqlite backend)\n";
  std::cout << "  trends           Print topic counts for recent posts\n";
  std::cout << "      --limit N          number of topics (default 20)\n";
  std::cout << "      --hours H          look-back window in hours (default 24)\n";
  std::cout << "  config-path      Print the config file location\n";
  std::cout << "  version          Show version\n";
  std::cout << "  help             Show this help\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "feed") {
    return run_feed(std::move(args));
  }
  if (subcommand == "trends") {
    return run_trends(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace feedrank::cli
