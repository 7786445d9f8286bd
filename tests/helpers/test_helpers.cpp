#include "tests/helpers/test_helpers.hpp"

#include "feedrank/cli/commands.hpp"
#include "feedrank/common/time.hpp"
#include "feedrank/config/config.hpp"
#include "feedrank/observability/global.hpp"
#include "feedrank/observability/noop_observer.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <stdexcept>

namespace feedrank::testing {

config::Config mock_config() {
  config::Config config;
  config.store.backend = "memory";
  config.observability.backend = "none";
  config.news.enabled = false;
  return config;
}

store::User make_user(const std::string &id, std::vector<std::string> following) {
  store::User user;
  user.id = id;
  user.handle = id;
  user.display_name = "User " + id;
  user.following_count = following.size();
  user.following_ids = std::move(following);
  return user;
}

store::Post make_post(const std::string &id, const std::string &author_id, const double age_seconds,
                      std::vector<store::Topic> topics) {
  store::Post post;
  post.id = id;
  post.author_id = author_id;
  post.text = "post " + id;
  post.topics = std::move(topics);
  post.created_at = kNow - age_seconds;
  return post;
}

ranking::Candidate make_candidate(const std::string &id, const std::string &author_id,
                                  const double age_seconds, const ranking::CandidateSource source) {
  ranking::Candidate candidate;
  candidate.post = make_post(id, author_id, age_seconds);
  candidate.source = source;
  return candidate;
}

std::unique_ptr<store::MemoryStore> make_store() {
  return std::make_unique<store::MemoryStore>(86400.0 * 7, common::fixed_clock(kNow));
}

void add_engagements(store::IStore &store, const std::string &post_id,
                     const store::EngagementType type, const std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    const auto status = store.add_engagement(store::Engagement{.user_id = "fan" + std::to_string(i),
                                                               .post_id = post_id,
                                                               .type = type,
                                                               .created_at = kNow - 60.0});
    if (!status.ok()) {
      throw std::runtime_error(status.error());
    }
  }
}

void StubHttpClient::set_response(const std::uint16_t status, std::string body) {
  response_ = net::HttpResponse{};
  response_.status = status;
  response_.body = std::move(body);
}

void StubHttpClient::set_network_error(std::string message) {
  response_ = net::HttpResponse{};
  response_.network_error = true;
  response_.network_error_message = std::move(message);
}

net::HttpResponse StubHttpClient::get(const std::string &url,
                                      const std::unordered_map<std::string, std::string> &,
                                      std::uint64_t) {
  ++calls_;
  last_url_ = url;
  return response_;
}

RecordingObserver::RecordingObserver(
    std::shared_ptr<std::vector<observability::ObserverEvent>> events,
    std::shared_ptr<std::vector<observability::ObserverMetric>> metrics)
    : events_(std::move(events)), metrics_(std::move(metrics)) {}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  events_->push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  metrics_->push_back(metric);
}

ObserverCapture::ObserverCapture()
    : events_(std::make_shared<std::vector<observability::ObserverEvent>>()),
      metrics_(std::make_shared<std::vector<observability::ObserverMetric>>()) {
  observability::set_global_observer(std::make_unique<RecordingObserver>(events_, metrics_));
}

ObserverCapture::~ObserverCapture() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("feedrank-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ConfigOverrideGuard::ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
  old_override = config::config_path_override();
  if (next.has_value()) {
    config::set_config_path_override(*next);
  } else {
    config::clear_config_path_override();
  }
}

ConfigOverrideGuard::~ConfigOverrideGuard() {
  if (old_override.has_value()) {
    config::set_config_path_override(*old_override);
  } else {
    config::clear_config_path_override();
  }
}

int run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = args;
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }
  return cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace feedrank::testing
