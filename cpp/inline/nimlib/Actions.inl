#include "nimlib/Actions.hpp"

#include <utility>

namespace nimlib {

inline SplitInto SplitInto::canonical() const {
  if (second < first) return SplitInto{second, first};
  return *this;
}

inline bool SplitInto::is_valid_for(height_t remainder) const {
  if (first.empty() || second.empty()) return false;
  // first + second may wrap around
  return first.height <= remainder && remainder - first.height == second.height;
}

}  // namespace nimlib
