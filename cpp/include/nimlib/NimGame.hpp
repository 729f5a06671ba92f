#pragma once

#include "nimlib/Actions.hpp"
#include "nimlib/BasicTypes.hpp"
#include "nimlib/Rules.hpp"

#include <optional>
#include <vector>

namespace nimlib {

// An action addressed to one stack of a position.
struct PositionedAction {
  bool operator==(const PositionedAction&) const = default;

  stack_index_t stack_index;
  NimAction action;
};

/*
 * A Nim game: a RuleSet together with the current position.
 *
 * The default game takes 1, 2 or 3 coins (never splitting) from a single stack of 10.
 */
class NimGame {
 public:
  NimGame();
  NimGame(RuleSet rules, Position stacks);

  const RuleSet& rules() const { return rules_; }
  const Position& stacks() const { return stacks_; }

  // Legal moves of every stack, in stack order; within a stack, in calculate_legal_moves() order.
  std::vector<PositionedAction> enumerate_moves() const;

  // Throws util::CleanException if the stack index is out of range.
  std::optional<MoveError> check_move(const PositionedAction& move) const;

  /*
   * Applies move to the addressed stack. If the move splits, the stack is replaced by the two
   * halves: the first half stays at stack_index and the second is inserted right after it.
   *
   * Throws IllegalMoveError (leaving the game unchanged) if the move is illegal, and
   * util::CleanException if the stack index is out of range.
   */
  void apply_move(const PositionedAction& move);

  Nimber calculate_nimber() const;
  bool is_first_player_win() const { return !calculate_nimber().is_zero(); }
  bool is_terminal() const;

 private:
  void validate_index(stack_index_t stack_index) const;

  RuleSet rules_;
  Position stacks_;
};

}  // namespace nimlib
