#pragma once

#include "nimlib/Actions.hpp"
#include "nimlib/BasicTypes.hpp"
#include "nimlib/Rules.hpp"

#include <optional>
#include <vector>

namespace nimlib {

/*
 * Returns std::nullopt if action is legal for stack under rules, and the reason otherwise.
 *
 * The checks are made in this order, and the first failing one is reported:
 *
 * 1. place actions are not supported        -> kPlaceNotSupported
 * 2. amount must be positive                -> kZeroAmount
 * 3. amount must not exceed the height      -> kAmountExceedsHeight
 * 4. a split must partition the remainder   -> kInvalidSplit
 * 5. some rule must admit the amount        -> kNoMatchingRule
 * 6. one of those rules must admit the split shape
 *                                           -> kSplitNotPermitted / kSplitRequired
 *
 * A split is accepted in either order; (2, 1) is the same split as (1, 2).
 */
std::optional<MoveError> check_move(const RuleSet& rules, Stack stack, const NimAction& action);

/*
 * Every legal action for stack under rules, ordered by rule, then by amount, then by split (the
 * unsplit variant first, then the splits in calculate_splits() order). An action admitted by
 * several rules is listed once per rule.
 */
std::vector<NimAction> calculate_legal_moves(const RuleSet& rules, Stack stack);

/*
 * Takes the coins off stack and returns the canonical split of the remainder. If the result is a
 * SplitInto, the caller replaces the (reduced) stack by the two halves.
 *
 * The action must be legal for stack (see check_move()); this is not checked. Throws
 * util::Exception for a PlaceAction.
 */
NimSplit apply_move_unchecked(Stack& stack, const NimAction& action);

/*
 * check_move() followed by apply_move_unchecked(). On success, stores the split in result and
 * returns std::nullopt. Otherwise returns the check_move() error, leaving stack and result
 * untouched.
 */
std::optional<MoveError> try_apply_move(const RuleSet& rules, Stack& stack,
                                        const NimAction& action, NimSplit& result);

/*
 * Same as try_apply_move(), but throws IllegalMoveError carrying the
 * check_move() error, leaving stack untouched, if the action is illegal.
 */
NimSplit apply_move(const RuleSet& rules, Stack& stack, const NimAction& action);

}  // namespace nimlib
