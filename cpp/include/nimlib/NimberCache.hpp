#pragma once

#include "nimlib/BasicTypes.hpp"

#include <mutex>
#include <optional>
#include <vector>

namespace nimlib {

/*
 * Memo table mapping stack height -> Nimber, for exactly one RuleSet.
 *
 * Entries are stored densely, indexed by height. An entry, once written, is never changed.
 *
 * Thread-safety: lookup() and insert() are safe to call concurrently. The computation lock is
 * held by NimberEngine for the whole duration of any first-time computation, so that at most one
 * thread computes missing entries at a time. Threads that only hit cached entries never touch the
 * computation lock.
 */
class NimberCache {
 public:
  NimberCache() = default;

  // Copies the entries; the copy gets its own locks.
  NimberCache(const NimberCache& other);
  NimberCache& operator=(const NimberCache& other);

  std::optional<Nimber> lookup(height_t height) const;

  // Throws util::Exception if height already has a different nimber.
  void insert(height_t height, Nimber nimber);

  // Number of heights with a cached nimber.
  size_t num_entries() const;

  std::mutex& computation_mutex() const { return computation_mutex_; }

 private:
  using entry_t = std::optional<Nimber>;
  using table_t = std::vector<entry_t>;

  table_t snapshot() const;

  mutable std::mutex table_mutex_;
  mutable std::mutex computation_mutex_;
  table_t table_;
  size_t num_entries_ = 0;
};

}  // namespace nimlib
