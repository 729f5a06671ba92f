#include "nimlib/Rules.hpp"

namespace nimlib {

inline Rule Rule::take_exact(height_t amount, SplitPolicy split) {
  return Rule{TakeExact{amount}, split};
}

inline Rule Rule::take_any(SplitPolicy split) { return Rule{TakeAny{}, split}; }

inline Rule Rule::place() { return Rule{PlaceCoins{}, SplitPolicy::kNever}; }

inline bool Rule::admits_amount(height_t amount, Stack stack) const {
  if (amount == 0 || amount > stack.height) return false;

  if (const TakeExact* exact = std::get_if<TakeExact>(&take)) {
    return exact->amount == amount;
  }
  return std::holds_alternative<TakeAny>(take);
}

inline bool Rule::admits_split(bool split) const {
  switch (this->split) {
    case SplitPolicy::kNever:
      return !split;
    case SplitPolicy::kOptional:
      return true;
    case SplitPolicy::kAlways:
      return split;
  }
  return false;
}

}  // namespace nimlib
