#include "nimlib/Actions.hpp"

#include <magic_enum/magic_enum.hpp>

#include <sstream>
#include <string>

namespace nimlib {

namespace {

std::string action_str(const NimAction& action) {
  std::ostringstream ss;
  ss << action;
  return ss.str();
}

}  // namespace

std::string_view move_error_name(MoveError error) {
  std::string_view name = magic_enum::enum_name(error);
  name.remove_prefix(1);  // drop the 'k'
  return name;
}

const char* move_error_description(MoveError error) {
  switch (error) {
    case MoveError::kAmountExceedsHeight:
      return "cannot take more coins than the stack holds";
    case MoveError::kZeroAmount:
      return "must take at least one coin";
    case MoveError::kSplitNotPermitted:
      return "no matching rule permits splitting the stack";
    case MoveError::kSplitRequired:
      return "every matching rule requires splitting the stack";
    case MoveError::kInvalidSplit:
      return "split halves must be non-empty and add up to the remaining coins";
    case MoveError::kNoMatchingRule:
      return "no rule allows taking this many coins";
    case MoveError::kPlaceNotSupported:
      return "placing coins is not supported";
  }
  return "unknown move error";
}

IllegalMoveError::IllegalMoveError(MoveError error, Stack stack, const NimAction& action)
    : util::CleanException("Illegal move [{}] on a stack of height {}: {}", action_str(action),
                           stack.height, move_error_description(error)),
      error_(error) {}

std::ostream& operator<<(std::ostream& os, const NimSplit& split) {
  if (const SplitInto* into = std::get_if<SplitInto>(&split)) {
    return os << into->first.height << "+" << into->second.height;
  }
  return os << "no split";
}

std::ostream& operator<<(std::ostream& os, const NimAction& action) {
  if (const TakeAction* take = std::get_if<TakeAction>(&action)) {
    os << "take " << take->amount;
    if (is_split(take->split)) {
      os << ", split " << take->split;
    }
    return os;
  }
  return os << "place " << std::get<PlaceAction>(action).amount;
}

std::ostream& operator<<(std::ostream& os, MoveError error) {
  return os << move_error_name(error);
}

}  // namespace nimlib
