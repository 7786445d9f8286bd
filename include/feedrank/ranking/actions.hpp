#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace feedrank::ranking {

enum class Action {
  Like,
  Repost,
  Reply,
  Quote,
  Click,
  Share,
  FollowAuthor,
  NotInterested,
  BlockAuthor,
  MuteAuthor,
  Report,
};

inline constexpr std::size_t kActionCount = 11;

/// Positive actions first, then negative; explanations list action scores in this order.
[[nodiscard]] const std::array<Action, kActionCount> &all_actions();
[[nodiscard]] std::string_view action_name(Action action);
[[nodiscard]] double action_weight(Action action);
[[nodiscard]] bool is_negative_action(Action action);

/// One probability per action, indexed by `Action`.
struct ActionProbabilities {
  std::array<double, kActionCount> values{};

  [[nodiscard]] double get(Action action) const {
    return values[static_cast<std::size_t>(action)];
  }
  void set(Action action, double probability) {
    values[static_cast<std::size_t>(action)] = probability;
  }

  bool operator==(const ActionProbabilities &) const = default;
};

} // namespace feedrank::ranking
