#pragma once

#include "feedrank/ranking/preferences.hpp"

#include <cstdint>
#include <string>

namespace feedrank::config {

struct RankingConfig {
  std::size_t limit_in_network = 200;
  std::size_t limit_per_author = 20;
  std::size_t limit_oon = 150;
  std::size_t following_only_limit = 300;
  double max_age_hours = 168.0;
  std::size_t default_limit = 50;
  std::size_t external_limit = 25;
};

struct StoreConfig {
  std::string backend = "sqlite";
  std::string path = "~/.feedrank/feedrank.db";
  double retention_hours = 336.0;
};

struct NewsConfig {
  bool enabled = false;
  std::string api_key;
  std::string endpoint = "https://newsapi.org/v2/top-headlines";
  std::string category = "general";
  std::string country = "us";
  std::uint32_t timeout_ms = 10'000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  RankingConfig ranking;
  ranking::AlgorithmPreferences preferences;
  StoreConfig store;
  NewsConfig news;
  ObservabilityConfig observability;
};

} // namespace feedrank::config
