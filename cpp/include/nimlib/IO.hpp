#pragma once

#include "nimlib/Actions.hpp"
#include "nimlib/BasicTypes.hpp"
#include "nimlib/NimGame.hpp"
#include "nimlib/Rules.hpp"

#include <string>
#include <utility>
#include <vector>

namespace nimlib {

// Human-readable and CSV renderings of the nimlib types.
struct IO {
  using height_nimber_t = std::pair<height_t, Nimber>;

  // "take 2", "take 1, split 1+2", "place 3"
  static std::string action_to_str(const NimAction& action);
  static std::string move_to_str(const PositionedAction& move);  // "stack 0: take 2"

  // "take 2 (split: never)", "take any (split: optional)", "place (split: never)"
  static std::string rule_to_str(const Rule& rule);

  /*
   * Splits for height 6:
   * 1 + 5
   * 2 + 4
   * 3 + 3
   *
   * Each column is right-aligned. "No splits for height 1" when splits is empty.
   */
  static std::string splits_to_str(height_t height, const std::vector<SplitInto>& splits);
  static std::string splits_to_csv(const std::vector<SplitInto>& splits);  // "left,right" header

  static std::string nimbers_to_str(const std::vector<height_nimber_t>& nimbers);
  // "height,nimber" header
  static std::string nimbers_to_csv(const std::vector<height_nimber_t>& nimbers);

  // One line per stack, then the nim-sum and who wins with optimal play.
  static std::string position_to_str(const Position& position,
                                     const std::vector<Nimber>& stack_nimbers, Nimber total);
};

}  // namespace nimlib
