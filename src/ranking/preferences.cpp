#include "feedrank/ranking/preferences.hpp"

#include "feedrank/common/fs.hpp"
#include "feedrank/common/json_util.hpp"

#include <array>
#include <charconv>
#include <utility>

namespace feedrank::ranking {

namespace {

using Field = std::pair<const char *, double AlgorithmPreferences::*>;

constexpr std::array<Field, 11> kFields = {{
    {"recency_vs_popularity", &AlgorithmPreferences::recency_vs_popularity},
    {"friends_vs_global", &AlgorithmPreferences::friends_vs_global},
    {"niche_vs_viral", &AlgorithmPreferences::niche_vs_viral},
    {"tech_weight", &AlgorithmPreferences::tech_weight},
    {"politics_weight", &AlgorithmPreferences::politics_weight},
    {"culture_weight", &AlgorithmPreferences::culture_weight},
    {"memes_weight", &AlgorithmPreferences::memes_weight},
    {"finance_weight", &AlgorithmPreferences::finance_weight},
    {"diversity_strength", &AlgorithmPreferences::diversity_strength},
    {"exploration", &AlgorithmPreferences::exploration},
    {"negative_signal_strength", &AlgorithmPreferences::negative_signal_strength},
}};

} // namespace

std::string preferences_to_json(const AlgorithmPreferences &preferences) {
  std::string out = "{";
  for (std::size_t i = 0; i < kFields.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += "\"" + std::string(kFields[i].first) +
           "\":" + common::json_number(preferences.*(kFields[i].second));
  }
  out += "}";
  return out;
}

common::Result<AlgorithmPreferences> preferences_from_json(const std::string &json,
                                                           const AlgorithmPreferences &base) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{' || trimmed.back() != '}') {
    return common::Result<AlgorithmPreferences>::failure("preferences must be a JSON object");
  }

  AlgorithmPreferences out = base;
  for (const auto &[name, member] : kFields) {
    const std::string raw = common::json_get_number(trimmed, name);
    if (raw.empty() || raw == "null") {
      continue;
    }
    double parsed = 0.0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec != std::errc() || ptr != raw.data() + raw.size()) {
      return common::Result<AlgorithmPreferences>::failure(std::string("invalid number for ") +
                                                           name + ": " + raw);
    }
    out.*member = parsed;
  }
  return common::Result<AlgorithmPreferences>::success(out);
}

} // namespace feedrank::ranking
