#pragma once

#include "feedrank/config/schema.hpp"
#include "feedrank/net/http.hpp"
#include "feedrank/observability/observer.hpp"
#include "feedrank/ranking/types.hpp"
#include "feedrank/store/memory_store.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace feedrank::testing {

// 2024-05-01T12:00:00Z
inline constexpr double kNow = 1714564800.0;

config::Config mock_config();

store::User make_user(const std::string &id, std::vector<std::string> following = {});
store::Post make_post(const std::string &id, const std::string &author_id, double age_seconds,
                      std::vector<store::Topic> topics = {});
ranking::Candidate make_candidate(const std::string &id, const std::string &author_id,
                                  double age_seconds,
                                  ranking::CandidateSource source = ranking::CandidateSource::InNetwork);

/// Memory store whose clock is pinned to kNow.
std::unique_ptr<store::MemoryStore> make_store();

/// Adds `count` engagements of `type` on `post_id` from synthetic users.
void add_engagements(store::IStore &store, const std::string &post_id,
                     store::EngagementType type, std::size_t count);

class StubHttpClient final : public net::HttpClient {
public:
  void set_response(std::uint16_t status, std::string body);
  void set_network_error(std::string message);

  [[nodiscard]] net::HttpResponse
  get(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
      std::uint64_t timeout_ms) override;

  [[nodiscard]] const std::string &last_url() const { return last_url_; }
  [[nodiscard]] std::size_t calls() const { return calls_; }

private:
  net::HttpResponse response_;
  std::string last_url_;
  std::size_t calls_ = 0;
};

/// Captures every event and metric; the vectors are shared so the test keeps a handle after
/// the observer is installed globally.
class RecordingObserver final : public observability::IObserver {
public:
  RecordingObserver(std::shared_ptr<std::vector<observability::ObserverEvent>> events,
                    std::shared_ptr<std::vector<observability::ObserverMetric>> metrics);

  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  void flush() override {}
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<std::vector<observability::ObserverEvent>> events_;
  std::shared_ptr<std::vector<observability::ObserverMetric>> metrics_;
};

/// Installs a RecordingObserver for its lifetime and restores the no-op observer afterwards.
class ObserverCapture {
public:
  ObserverCapture();
  ~ObserverCapture();

  ObserverCapture(const ObserverCapture &) = delete;
  ObserverCapture &operator=(const ObserverCapture &) = delete;

  [[nodiscard]] const std::vector<observability::ObserverEvent> &events() const { return *events_; }
  [[nodiscard]] const std::vector<observability::ObserverMetric> &metrics() const {
    return *metrics_;
  }

private:
  std::shared_ptr<std::vector<observability::ObserverEvent>> events_;
  std::shared_ptr<std::vector<observability::ObserverMetric>> metrics_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt);
  ~ConfigOverrideGuard();
};

int run_cli(const std::vector<std::string> &args);

} // namespace feedrank::testing
