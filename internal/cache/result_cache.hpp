#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"
#include "loadplan/core/v1/types.pb.h"

namespace loadplan::cache {

inline constexpr std::size_t kDefaultMaxEntries = 100;

struct ResultCacheOptions {
  std::size_t               max_entries{kDefaultMaxEntries};
  std::chrono::milliseconds ttl{0};
};

/*
  Result snapshot cache.

  Entries are immutable once stored and shared with every reader. When the
  cache is full the oldest insertion goes first; entries older than ttl are
  dropped on lookup. A zero ttl disables expiry.
*/
class ResultCache {
 public:
  using ResultPtr = std::shared_ptr<const loadplan::core::v1::OptimizationResult>;

  struct Stats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::size_t   entries{0};
  };

  explicit ResultCache(ResultCacheOptions options = {}, loadplan::util::ClockFn clock = loadplan::util::Now);

  // nullptr on miss or expiry.
  ResultPtr Get(const std::string& key);

  // Replaces any previous entry under key and counts as a fresh insertion.
  void Put(const std::string& key, ResultPtr result);

  void Clear();

  std::size_t Size() const;
  Stats       GetStats() const;

  const ResultCacheOptions& options() const {
    return options_;
  }

 private:
  struct Entry {
    ResultPtr                        result;
    loadplan::util::TimePoint        stored_at;
    std::list<std::string>::iterator order;
  };

  bool Expired(const Entry& entry, loadplan::util::TimePoint now) const;
  void EraseLocked(std::unordered_map<std::string, Entry>::iterator it);

  ResultCacheOptions      options_;
  loadplan::util::ClockFn clock_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::list<std::string>                 insertion_order_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
};

} // namespace loadplan::cache
