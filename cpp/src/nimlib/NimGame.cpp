#include "nimlib/NimGame.hpp"

#include "nimlib/MoveGenerator.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <utility>

namespace nimlib {

namespace {

constexpr height_t kDefaultStackHeight = 10;

}  // namespace

NimGame::NimGame()
    : NimGame(RuleSet{Rule::take_exact(1), Rule::take_exact(2), Rule::take_exact(3)},
              Position{Stack(kDefaultStackHeight)}) {}

NimGame::NimGame(RuleSet rules, Position stacks)
    : rules_(std::move(rules)), stacks_(std::move(stacks)) {}

std::vector<PositionedAction> NimGame::enumerate_moves() const {
  std::vector<PositionedAction> moves;
  for (stack_index_t i = 0; i < stacks_.size(); ++i) {
    for (NimAction& action : calculate_legal_moves(rules_, stacks_[i])) {
      moves.push_back(PositionedAction{i, std::move(action)});
    }
  }
  return moves;
}

std::optional<MoveError> NimGame::check_move(const PositionedAction& move) const {
  validate_index(move.stack_index);
  return nimlib::check_move(rules_, stacks_[move.stack_index], move.action);
}

void NimGame::apply_move(const PositionedAction& move) {
  validate_index(move.stack_index);

  Stack& stack = stacks_[move.stack_index];
  NimSplit split = nimlib::apply_move(rules_, stack, move.action);
  if (const SplitInto* into = std::get_if<SplitInto>(&split)) {
    stack = into->first;
    stacks_.insert(stacks_.begin() + move.stack_index + 1, into->second);
  }
  LOG_DEBUG("Applied move to stack {}; {} stacks remain", move.stack_index, stacks_.size());
}

Nimber NimGame::calculate_nimber() const { return rules_.nimber_for_position(stacks_); }

bool NimGame::is_terminal() const {
  for (const Stack& stack : stacks_) {
    if (!calculate_legal_moves(rules_, stack).empty()) return false;
  }
  return true;
}

void NimGame::validate_index(stack_index_t stack_index) const {
  if (stack_index >= stacks_.size()) {
    throw util::CleanException("Stack index {} out of range (position has {} stacks)", stack_index,
                               stacks_.size());
  }
}

}  // namespace nimlib
