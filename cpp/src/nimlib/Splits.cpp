#include "nimlib/Splits.hpp"

namespace nimlib {

std::vector<SplitInto> calculate_splits(height_t remainder) {
  std::vector<SplitInto> splits;

  // Stacks of height 0 and 1 can't be split
  if (remainder < 2) return splits;

  splits.reserve(remainder / 2);
  for (height_t a = 1; a <= remainder / 2; ++a) {
    splits.push_back(SplitInto{Stack(a), Stack(remainder - a)});
  }
  return splits;
}

}  // namespace nimlib
