#pragma once

#include "nimlib/BasicTypes.hpp"
#include "util/Exceptions.hpp"

#include <cstdint>
#include <ostream>
#include <string_view>
#include <variant>

namespace nimlib {

// The remainder of the stack stays a single stack.
struct NoSplit {
  bool operator==(const NoSplit&) const = default;
};

// The remainder of the stack is split into two non-empty stacks.
//
// (a, b) and (b, a) are the same split. The canonical form, as produced by calculate_splits() and
// apply_move_unchecked(), has first <= second.
struct SplitInto {
  bool operator==(const SplitInto&) const = default;

  SplitInto canonical() const;

  // first, second >= 1 and first + second == remainder
  bool is_valid_for(height_t remainder) const;

  Stack first;
  Stack second;
};

using NimSplit = std::variant<NoSplit, SplitInto>;

inline bool is_split(const NimSplit& split) { return std::holds_alternative<SplitInto>(split); }

// Take amount coins from a stack, then (maybe) split the remainder.
struct TakeAction {
  bool operator==(const TakeAction&) const = default;

  height_t amount;
  NimSplit split;
};

// Place amount coins from the player's pool onto a stack. See PlaceCoins.
struct PlaceAction {
  bool operator==(const PlaceAction&) const = default;

  height_t amount;
};

using NimAction = std::variant<TakeAction, PlaceAction>;

// Reasons check_move() can reject an action.
enum class MoveError : uint8_t {
  kAmountExceedsHeight,
  kZeroAmount,
  kSplitNotPermitted,
  kSplitRequired,
  kInvalidSplit,
  kNoMatchingRule,
  kPlaceNotSupported
};

std::string_view move_error_name(MoveError error);  // "AmountExceedsHeight", etc.
const char* move_error_description(MoveError error);

/*
 * Thrown by apply_move() and NimGame::apply_move() for an action rejected by check_move().
 *
 * This is a util::CleanException: an illegal move is an input problem, not a bug.
 */
class IllegalMoveError : public util::CleanException {
 public:
  IllegalMoveError(MoveError error, Stack stack, const NimAction& action);

  MoveError error() const { return error_; }

 private:
  MoveError error_;
};

std::ostream& operator<<(std::ostream& os, const NimSplit& split);
std::ostream& operator<<(std::ostream& os, const NimAction& action);
std::ostream& operator<<(std::ostream& os, MoveError error);

}  // namespace nimlib

#include "inline/nimlib/Actions.inl"
