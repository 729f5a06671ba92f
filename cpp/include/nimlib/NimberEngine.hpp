#pragma once

#include "nimlib/BasicTypes.hpp"
#include "nimlib/NimberCache.hpp"
#include "nimlib/Rules.hpp"

namespace nimlib {

/*
 * The nimber of a single stack of the given height under rules.
 *
 * Uses the MEX (minimum excluded) rule: every legal move from the stack is applied, and the value
 * of each resulting position (the XOR of the nimbers of its one or two stacks) goes into an
 * exclusion set. The nimber is the smallest non-negative integer not in that set; a stack with
 * no legal moves has nimber 0.
 *
 * Every move strictly lowers the total number of coins, so the recursion only ever asks for
 * smaller heights. Missing heights are filled in increasing order, which keeps the recursion
 * depth constant.
 *
 * cache must belong to rules (see RuleSet::cache()); passing a cache that was filled under
 * different rules gives wrong results. Safe to call concurrently on the same rules and cache.
 */
Nimber calculate_nimber_for_height(const RuleSet& rules, height_t height, NimberCache& cache);

/*
 * The nimber of a full position: the XOR of the nimbers of its stacks. The position is a win for
 * the player to move iff the result is non-zero.
 */
Nimber calculate_nimber_for_position(const RuleSet& rules, const Position& position,
                                     NimberCache& cache);

}  // namespace nimlib
