#include "nimlib/NimberEngine.hpp"

#include "nimlib/MoveGenerator.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/dynamic_bitset.hpp>

#include <mutex>

namespace nimlib {

namespace {

Nimber nimber_locked(const RuleSet& rules, height_t height, NimberCache& cache);

// The value of the position left behind by action.
Nimber successor_value(const RuleSet& rules, height_t height, const TakeAction& take,
                       NimberCache& cache) {
  if (const SplitInto* split = std::get_if<SplitInto>(&take.split)) {
    return nimber_locked(rules, split->first.height, cache) ^
           nimber_locked(rules, split->second.height, cache);
  }
  return nimber_locked(rules, height - take.amount, cache);
}

// Requires cache.computation_mutex() to be held.
Nimber nimber_locked(const RuleSet& rules, height_t height, NimberCache& cache) {
  if (std::optional<Nimber> cached = cache.lookup(height)) return *cached;

  std::vector<NimAction> moves = calculate_legal_moves(rules, Stack(height));

  // n moves reach at most n distinct values, so the mex is at most n. Larger values can't affect
  // it and are not recorded.
  boost::dynamic_bitset<> excluded(moves.size() + 1);
  for (const NimAction& action : moves) {
    Nimber value = successor_value(rules, height, std::get<TakeAction>(action), cache);
    if (value.value < excluded.size()) {
      excluded.set(value.value);
    }
  }

  excluded.flip();
  Nimber nimber(excluded.find_first());

  LOG_TRACE("nimber({}) = {} ({} moves)", height, nimber.value, moves.size());
  cache.insert(height, nimber);
  return nimber;
}

}  // namespace

Nimber calculate_nimber_for_height(const RuleSet& rules, height_t height, NimberCache& cache) {
  if (std::optional<Nimber> cached = cache.lookup(height)) return *cached;

  std::lock_guard<std::mutex> lock(cache.computation_mutex());

  LOG_DEBUG("Computing nimbers up to height {} ({} cached)", height, cache.num_entries());
  for (height_t h = 0; h < height; ++h) {
    nimber_locked(rules, h, cache);
  }
  return nimber_locked(rules, height, cache);
}

Nimber calculate_nimber_for_position(const RuleSet& rules, const Position& position,
                                     NimberCache& cache) {
  Nimber nimber;
  for (const Stack& stack : position) {
    nimber ^= calculate_nimber_for_height(rules, stack.height, cache);
  }
  return nimber;
}

}  // namespace nimlib
