#include "result_cache.hpp"

#include <iterator>
#include <mutex>
#include <utility>

#include "internal/util/errors.hpp"

namespace loadplan::cache {

ResultCache::ResultCache(ResultCacheOptions options, loadplan::util::ClockFn clock) : options_(options), clock_(std::move(clock)) {
  if (options_.max_entries == 0) {
    throw loadplan::util::InvalidArgument("result cache: max_entries must be positive");
  }
  if (options_.ttl.count() < 0) {
    throw loadplan::util::InvalidArgument("result cache: ttl must not be negative");
  }
  if (!clock_) {
    throw loadplan::util::InvalidArgument("result cache: clock is required");
  }
}

bool ResultCache::Expired(const Entry& entry, loadplan::util::TimePoint now) const {
  return options_.ttl.count() > 0 && now - entry.stored_at >= options_.ttl;
}

void ResultCache::EraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
  insertion_order_.erase(it->second.order);
  entries_.erase(it);
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

ResultCache::ResultPtr ResultCache::Get(const std::string& key) {
  const auto now = clock_();
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(key);
    if (it == entries_.end()) {
      misses_.fetch_add(1, std::memory_order_relaxed);
      return nullptr;
    }
    if (!Expired(it->second, now)) {
      hits_.fetch_add(1, std::memory_order_relaxed);
      return it->second.result;
    }
  }

  // Expired: re-check under the writer lock, another caller may have
  // refreshed the entry in between.
  std::unique_lock lock(mutex_);
  auto             it = entries_.find(key);
  if (it != entries_.end() && Expired(it->second, now)) {
    EraseLocked(it);
  } else if (it != entries_.end()) {
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second.result;
  }
  misses_.fetch_add(1, std::memory_order_relaxed);
  return nullptr;
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void ResultCache::Put(const std::string& key, ResultPtr result) {
  if (!result) {
    throw loadplan::util::InvalidArgument("result cache: refusing to store a null result");
  }

  std::unique_lock lock(mutex_);

  auto existing = entries_.find(key);
  if (existing != entries_.end()) {
    EraseLocked(existing);
  }

  insertion_order_.push_back(key);
  entries_.emplace(key, Entry{std::move(result), clock_(), std::prev(insertion_order_.end())});

  while (entries_.size() > options_.max_entries) {
    EraseLocked(entries_.find(insertion_order_.front()));
  }
}

void ResultCache::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
  insertion_order_.clear();
}

std::size_t ResultCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

ResultCache::Stats ResultCache::GetStats() const {
  Stats stats;
  stats.hits    = hits_.load(std::memory_order_relaxed);
  stats.misses  = misses_.load(std::memory_order_relaxed);
  stats.entries = Size();
  return stats;
}

} // namespace loadplan::cache
