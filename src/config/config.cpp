#include "feedrank/config/config.hpp"

#include "feedrank/common/fs.hpp"
#include "feedrank/common/toml.hpp"

#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace feedrank::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".feedrank";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

constexpr std::array<const char *, 7> kNewsCategories = {
    "business", "entertainment", "general", "health", "science", "sports", "technology"};

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("FEEDRANK_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    set_env_if_missing(common::trim(trimmed.substr(0, eq)), strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

// Config dir .env wins over the working directory's because values are never overwritten.
void load_dotenv_files() {
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

void load_preferences(ranking::AlgorithmPreferences &prefs, const common::TomlDocument &doc) {
  prefs.recency_vs_popularity =
      doc.get_double("preferences.recency_vs_popularity", prefs.recency_vs_popularity);
  prefs.friends_vs_global = doc.get_double("preferences.friends_vs_global", prefs.friends_vs_global);
  prefs.niche_vs_viral = doc.get_double("preferences.niche_vs_viral", prefs.niche_vs_viral);
  prefs.tech_weight = doc.get_double("preferences.tech_weight", prefs.tech_weight);
  prefs.politics_weight = doc.get_double("preferences.politics_weight", prefs.politics_weight);
  prefs.culture_weight = doc.get_double("preferences.culture_weight", prefs.culture_weight);
  prefs.memes_weight = doc.get_double("preferences.memes_weight", prefs.memes_weight);
  prefs.finance_weight = doc.get_double("preferences.finance_weight", prefs.finance_weight);
  prefs.diversity_strength =
      doc.get_double("preferences.diversity_strength", prefs.diversity_strength);
  prefs.exploration = doc.get_double("preferences.exploration", prefs.exploration);
  prefs.negative_signal_strength =
      doc.get_double("preferences.negative_signal_strength", prefs.negative_signal_strength);
}

std::size_t get_size(const common::TomlDocument &doc, const std::string &key,
                     const std::size_t fallback) {
  return static_cast<std::size_t>(doc.get_u64(key, fallback));
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *key = std::getenv("NEWS_API_KEY"); key != nullptr && *key) {
    config.news.api_key = key;
  }
  if (const char *category = std::getenv("NEWS_API_CATEGORY"); category != nullptr && *category) {
    config.news.category = common::to_lower(common::trim(category));
  }
  if (const char *country = std::getenv("NEWS_API_COUNTRY"); country != nullptr && *country) {
    config.news.country = common::to_lower(common::trim(country));
  }
  if (const char *path = std::getenv("FEEDRANK_STORE_PATH"); path != nullptr && *path) {
    config.store.path = common::expand_path(path);
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;

  auto &ranking = config.ranking;
  ranking.limit_in_network = get_size(doc, "ranking.limit_in_network", ranking.limit_in_network);
  ranking.limit_per_author = get_size(doc, "ranking.limit_per_author", ranking.limit_per_author);
  ranking.limit_oon = get_size(doc, "ranking.limit_oon", ranking.limit_oon);
  ranking.following_only_limit =
      get_size(doc, "ranking.following_only_limit", ranking.following_only_limit);
  ranking.max_age_hours = doc.get_double("ranking.max_age_hours", ranking.max_age_hours);
  ranking.default_limit = get_size(doc, "ranking.default_limit", ranking.default_limit);
  ranking.external_limit = get_size(doc, "ranking.external_limit", ranking.external_limit);

  load_preferences(config.preferences, doc);

  config.store.backend = common::to_lower(doc.get_string("store.backend", config.store.backend));
  config.store.path = expand_config_value(doc.get_string("store.path", config.store.path));
  config.store.retention_hours =
      doc.get_double("store.retention_hours", config.store.retention_hours);

  config.news.enabled = doc.get_bool("news.enabled", config.news.enabled);
  config.news.api_key = expand_config_value(doc.get_string("news.api_key", config.news.api_key));
  config.news.endpoint = doc.get_string("news.endpoint", config.news.endpoint);
  config.news.category = common::to_lower(doc.get_string("news.category", config.news.category));
  config.news.country = common::to_lower(doc.get_string("news.country", config.news.country));
  config.news.timeout_ms =
      static_cast<std::uint32_t>(doc.get_u64("news.timeout_ms", config.news.timeout_ms));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    config.store.path = common::expand_path(config.store.path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  const auto &ranking = config.ranking;
  file << "[ranking]\n";
  file << "limit_in_network = " << ranking.limit_in_network << "\n";
  file << "limit_per_author = " << ranking.limit_per_author << "\n";
  file << "limit_oon = " << ranking.limit_oon << "\n";
  file << "following_only_limit = " << ranking.following_only_limit << "\n";
  file << "max_age_hours = " << ranking.max_age_hours << "\n";
  file << "default_limit = " << ranking.default_limit << "\n";
  file << "external_limit = " << ranking.external_limit << "\n";

  const auto &prefs = config.preferences;
  file << "\n[preferences]\n";
  file << "recency_vs_popularity = " << prefs.recency_vs_popularity << "\n";
  file << "friends_vs_global = " << prefs.friends_vs_global << "\n";
  file << "niche_vs_viral = " << prefs.niche_vs_viral << "\n";
  file << "tech_weight = " << prefs.tech_weight << "\n";
  file << "politics_weight = " << prefs.politics_weight << "\n";
  file << "culture_weight = " << prefs.culture_weight << "\n";
  file << "memes_weight = " << prefs.memes_weight << "\n";
  file << "finance_weight = " << prefs.finance_weight << "\n";
  file << "diversity_strength = " << prefs.diversity_strength << "\n";
  file << "exploration = " << prefs.exploration << "\n";
  file << "negative_signal_strength = " << prefs.negative_signal_strength << "\n";

  file << "\n[store]\n";
  file << "backend = " << common::quote_toml_string(config.store.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.store.path) << "\n";
  file << "retention_hours = " << config.store.retention_hours << "\n";

  file << "\n[news]\n";
  file << "enabled = " << bool_to_toml(config.news.enabled) << "\n";
  if (!config.news.api_key.empty()) {
    file << "api_key = " << common::quote_toml_string(config.news.api_key) << "\n";
  }
  file << "endpoint = " << common::quote_toml_string(config.news.endpoint) << "\n";
  file << "category = " << common::quote_toml_string(config.news.category) << "\n";
  file << "country = " << common::quote_toml_string(config.news.country) << "\n";
  file << "timeout_ms = " << config.news.timeout_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.ranking.max_age_hours <= 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        "ranking.max_age_hours must be positive");
  }
  if (config.ranking.default_limit == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "ranking.default_limit must be at least 1");
  }
  if (config.ranking.limit_in_network == 0 && config.ranking.limit_oon == 0) {
    warnings.push_back("ranking.limit_in_network and ranking.limit_oon are both 0");
  }
  if (config.ranking.limit_per_author == 0) {
    warnings.push_back("ranking.limit_per_author is 0; in-network sourcing is disabled");
  }

  const std::string store_backend = common::to_lower(config.store.backend);
  if (store_backend != "memory" && store_backend != "sqlite") {
    return common::Result<std::vector<std::string>>::failure("Invalid store.backend: " +
                                                              config.store.backend);
  }
  if (store_backend == "sqlite" && common::trim(config.store.path).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "store.path is required for the sqlite backend");
  }
  if (config.store.retention_hours <= 0.0) {
    return common::Result<std::vector<std::string>>::failure(
        "store.retention_hours must be positive");
  }

  const std::string observability = common::to_lower(common::trim(config.observability.backend));
  for (const auto &part : common::split(observability, ',')) {
    if (part != "log" && part != "none" && part != "noop") {
      return common::Result<std::vector<std::string>>::failure(
          "Invalid observability.backend: " + config.observability.backend);
    }
  }

  if (config.news.enabled) {
    if (common::trim(config.news.api_key).empty()) {
      warnings.push_back("news.enabled is set but no api key is configured (NEWS_API_KEY)");
    }
    if (config.news.timeout_ms == 0) {
      return common::Result<std::vector<std::string>>::failure("news.timeout_ms must be positive");
    }
  }
  if (config.news.country.size() != 2) {
    warnings.push_back("news.country should be a two-letter code: " + config.news.country);
  }
  bool known_category = false;
  for (const auto *category : kNewsCategories) {
    known_category = known_category || config.news.category == category;
  }
  if (!known_category) {
    warnings.push_back("news.category is not a known category: " + config.news.category);
  }

  const auto &prefs = config.preferences;
  const auto out_of_range = [](const double value) { return value < 0.0 || value > 1.0; };
  if (out_of_range(prefs.recency_vs_popularity) || out_of_range(prefs.friends_vs_global) ||
      out_of_range(prefs.diversity_strength) || out_of_range(prefs.negative_signal_strength)) {
    warnings.push_back("preferences outside [0, 1] bias the ranking");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace feedrank::config
