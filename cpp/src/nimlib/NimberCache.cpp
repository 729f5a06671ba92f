#include "nimlib/NimberCache.hpp"

#include "util/Asserts.hpp"
#include "util/Exceptions.hpp"

namespace nimlib {

NimberCache::NimberCache(const NimberCache& other) {
  table_ = other.snapshot();
  for (const entry_t& entry : table_) {
    if (entry) ++num_entries_;
  }
}

NimberCache& NimberCache::operator=(const NimberCache& other) {
  if (this == &other) return *this;

  table_t table = other.snapshot();
  size_t num_entries = 0;
  for (const entry_t& entry : table) {
    if (entry) ++num_entries;
  }

  std::lock_guard<std::mutex> lock(table_mutex_);
  table_ = std::move(table);
  num_entries_ = num_entries;
  return *this;
}

std::optional<Nimber> NimberCache::lookup(height_t height) const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  if (height >= table_.size()) return std::nullopt;
  return table_[height];
}

void NimberCache::insert(height_t height, Nimber nimber) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  if (height >= table_.size()) {
    RELEASE_ASSERT(height < table_.max_size(), "height {} too large to cache", height);
    table_.resize(height + 1);
  }

  entry_t& entry = table_[height];
  if (entry) {
    if (*entry != nimber) {
      throw util::Exception("Conflicting nimbers for height {}: cached {}, new {}", height,
                            entry->value, nimber.value);
    }
    return;
  }
  entry = nimber;
  ++num_entries_;
}

size_t NimberCache::num_entries() const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  return num_entries_;
}

NimberCache::table_t NimberCache::snapshot() const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  return table_;
}

}  // namespace nimlib
