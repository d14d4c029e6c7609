#include "internal/cache/result_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using loadplan::cache::ResultCache;
using loadplan::cache::ResultCacheOptions;
using loadplan::core::v1::OptimizationResult;

ResultCache::ResultPtr MakeResult(const std::string& message) {
  auto result = std::make_shared<OptimizationResult>();
  result->set_success(true);
  result->set_message(message);
  return result;
}

struct FakeClock {
  loadplan::util::TimePoint now{};

  loadplan::util::ClockFn Fn() {
    return [this] { return now; };
  }
};

void TestPutAndGetShareTheSnapshot() {
  ResultCache cache;
  const auto  stored = MakeResult("first");
  cache.Put("k1", stored);

  const auto cached = cache.Get("k1");
  assert(cached == stored);
  assert(cached->message() == "first");
  assert(cache.Get("missing") == nullptr);

  const auto stats = cache.GetStats();
  assert(stats.hits == 1);
  assert(stats.misses == 1);
  assert(stats.entries == 1);
}

void TestOldestInsertionIsEvictedFirst() {
  ResultCache cache(ResultCacheOptions{2, std::chrono::milliseconds(0)});
  cache.Put("a", MakeResult("a"));
  cache.Put("b", MakeResult("b"));

  // Reading does not refresh insertion order.
  assert(cache.Get("a") != nullptr);
  cache.Put("c", MakeResult("c"));

  assert(cache.Size() == 2);
  assert(cache.Get("a") == nullptr);
  assert(cache.Get("b") != nullptr);
  assert(cache.Get("c") != nullptr);

  // Re-putting an existing key counts as a fresh insertion.
  cache.Put("b", MakeResult("b2"));
  cache.Put("d", MakeResult("d"));
  assert(cache.Get("c") == nullptr);
  assert(cache.Get("b")->message() == "b2");
}

void TestDefaultCapacityIsOneHundred() {
  ResultCache cache;
  assert(cache.options().max_entries == loadplan::cache::kDefaultMaxEntries);
  assert(cache.options().ttl == std::chrono::milliseconds(0));
  for (int i = 0; i < 150; ++i) {
    cache.Put("key-" + std::to_string(i), MakeResult(std::to_string(i)));
  }
  assert(cache.Size() == 100);
  assert(cache.Get("key-49") == nullptr);
  assert(cache.Get("key-50") != nullptr);
}

void TestEntriesExpireAfterTtl() {
  FakeClock   clock;
  ResultCache cache(ResultCacheOptions{10, std::chrono::milliseconds(500)}, clock.Fn());

  cache.Put("k", MakeResult("v"));
  clock.now += std::chrono::milliseconds(499);
  assert(cache.Get("k") != nullptr);

  clock.now += std::chrono::milliseconds(1);
  assert(cache.Get("k") == nullptr);
  assert(cache.Size() == 0);
}

void TestClearAndInvalidOptions() {
  ResultCache cache;
  cache.Put("k", MakeResult("v"));
  cache.Clear();
  assert(cache.Size() == 0);

  bool threw = false;
  try {
    ResultCache invalid(ResultCacheOptions{0, std::chrono::milliseconds(0)});
    (void)invalid;
  } catch (const loadplan::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    cache.Put("null", nullptr);
  } catch (const loadplan::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentReadersAndWriters() {
  ResultCache cache(ResultCacheOptions{16, std::chrono::milliseconds(0)});

  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&cache, t] {
      for (int i = 0; i < 200; ++i) {
        const auto key = "k" + std::to_string((t * 7 + i) % 32);
        if (!cache.Get(key)) {
          cache.Put(key, MakeResult(key));
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(cache.Size() <= 16);
  const auto stats = cache.GetStats();
  assert(stats.hits + stats.misses == 800);
}

} // namespace

int main() {
  TestPutAndGetShareTheSnapshot();
  TestOldestInsertionIsEvictedFirst();
  TestDefaultCapacityIsOneHundred();
  TestEntriesExpireAfterTtl();
  TestClearAndInvalidOptions();
  TestConcurrentReadersAndWriters();

  std::cout << "loadplan_unit_result_cache: pass\n";
  return 0;
}
