#include "nimlib/MoveGenerator.hpp"

#include "nimlib/Splits.hpp"
#include "util/Asserts.hpp"
#include "util/Exceptions.hpp"

namespace nimlib {

namespace {

// Appends the variants of taking amount coins that policy allows.
void add_take_variants(std::vector<NimAction>& moves, height_t amount, height_t remainder,
                       SplitPolicy policy) {
  if (policy != SplitPolicy::kAlways) {
    moves.push_back(TakeAction{amount, NoSplit{}});
  }
  if (policy != SplitPolicy::kNever) {
    for (const SplitInto& split : calculate_splits(remainder)) {
      moves.push_back(TakeAction{amount, split});
    }
  }
}

}  // namespace

std::optional<MoveError> check_move(const RuleSet& rules, Stack stack, const NimAction& action) {
  const TakeAction* take = std::get_if<TakeAction>(&action);
  if (!take) return MoveError::kPlaceNotSupported;

  if (take->amount == 0) return MoveError::kZeroAmount;
  if (take->amount > stack.height) return MoveError::kAmountExceedsHeight;

  height_t remainder = stack.height - take->amount;
  const SplitInto* split = std::get_if<SplitInto>(&take->split);
  if (split && !split->is_valid_for(remainder)) return MoveError::kInvalidSplit;

  bool amount_matched = false;
  for (const Rule& rule : rules) {
    if (!rule.admits_amount(take->amount, stack)) continue;
    amount_matched = true;
    if (rule.admits_split(split != nullptr)) return std::nullopt;
  }

  if (!amount_matched) return MoveError::kNoMatchingRule;
  return split ? MoveError::kSplitNotPermitted : MoveError::kSplitRequired;
}

std::vector<NimAction> calculate_legal_moves(const RuleSet& rules, Stack stack) {
  std::vector<NimAction> moves;

  for (const Rule& rule : rules) {
    if (const TakeExact* exact = std::get_if<TakeExact>(&rule.take)) {
      if (exact->amount <= stack.height) {
        add_take_variants(moves, exact->amount, stack.height - exact->amount, rule.split);
      }
    } else if (std::holds_alternative<TakeAny>(rule.take)) {
      for (height_t amount = 1; amount <= stack.height; ++amount) {
        add_take_variants(moves, amount, stack.height - amount, rule.split);
      }
    }
    // PlaceCoins: the pool is always empty, so there is nothing to place
  }

  return moves;
}

NimSplit apply_move_unchecked(Stack& stack, const NimAction& action) {
  const TakeAction* take = std::get_if<TakeAction>(&action);
  if (!take) {
    throw util::Exception("Cannot apply place action (amount={}): not supported",
                          std::get<PlaceAction>(action).amount);
  }
  DEBUG_ASSERT(take->amount <= stack.height, "take {} from height {}", take->amount,
               stack.height);

  stack.height -= take->amount;
  if (const SplitInto* split = std::get_if<SplitInto>(&take->split)) {
    return split->canonical();
  }
  return NoSplit{};
}

std::optional<MoveError> try_apply_move(const RuleSet& rules, Stack& stack,
                                        const NimAction& action, NimSplit& result) {
  std::optional<MoveError> error = check_move(rules, stack, action);
  if (!error) {
    result = apply_move_unchecked(stack, action);
  }
  return error;
}

NimSplit apply_move(const RuleSet& rules, Stack& stack, const NimAction& action) {
  NimSplit result = NoSplit{};
  if (std::optional<MoveError> error = try_apply_move(rules, stack, action, result)) {
    throw IllegalMoveError(*error, stack, action);
  }
  return result;
}

}  // namespace nimlib
