#pragma once

#include "nimlib/Actions.hpp"
#include "nimlib/BasicTypes.hpp"

#include <vector>

namespace nimlib {

/*
 * All ways to split remainder coins into two non-empty stacks, each unordered pair exactly once.
 *
 * Returns (a, remainder - a) for a = 1, 2, ..., remainder / 2, so every pair is canonical
 * (first <= second). Empty for remainder < 2.
 *
 * calculate_splits(4) == {(1, 3), (2, 2)}
 * calculate_splits(5) == {(1, 4), (2, 3)}
 */
std::vector<SplitInto> calculate_splits(height_t remainder);

}  // namespace nimlib
