#include "feedrank/ranking/actions.hpp"

namespace feedrank::ranking {

namespace {

struct ActionInfo {
  std::string_view name;
  double weight;
};

constexpr std::array<ActionInfo, kActionCount> kActionInfo = {{
    {"like", 1.0},
    {"repost", 1.2},
    {"reply", 1.0},
    {"quote", 0.8},
    {"click", 0.6},
    {"share", 0.9},
    {"follow_author", 0.7},
    {"not_interested", -1.5},
    {"block_author", -2.0},
    {"mute_author", -1.8},
    {"report", -2.0},
}};

} // namespace

const std::array<Action, kActionCount> &all_actions() {
  static const std::array<Action, kActionCount> actions = {
      Action::Like,          Action::Repost,      Action::Reply,      Action::Quote,
      Action::Click,         Action::Share,       Action::FollowAuthor, Action::NotInterested,
      Action::BlockAuthor,   Action::MuteAuthor,  Action::Report,
  };
  return actions;
}

std::string_view action_name(const Action action) {
  return kActionInfo[static_cast<std::size_t>(action)].name;
}

double action_weight(const Action action) {
  return kActionInfo[static_cast<std::size_t>(action)].weight;
}

bool is_negative_action(const Action action) { return action_weight(action) < 0.0; }

} // namespace feedrank::ranking
