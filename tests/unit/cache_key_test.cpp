#include "internal/cache/cache_key.hpp"

#include <cassert>
#include <iostream>

#include "internal/core/units.hpp"
#include "tests/support/load_plan_fixtures.hpp"

namespace {

using namespace loadplan::core;
using loadplan::cache::BuildCacheKey;
using loadplan::cache::KeyDigest;
using loadplan::testing::MakeContainer;
using loadplan::testing::MakePallet;
using loadplan::testing::MakeRequest;

std::vector<NormalizedRequest> NormalizeAll(const ProductRequests& requests) {
  std::vector<NormalizedRequest> normalized;
  for (const auto& request : requests) {
    normalized.push_back(NormalizeRequest(request));
  }
  return normalized;
}

const auto kContainer = MakeContainer(100, 100, 100, 1000);
const auto kPallet    = MakePallet(80, 80, 15, 10, 500);

void TestRequestOrderDoesNotChangeKey() {
  ProductRequests forward  = {MakeRequest("a", 10, 10, 10, 1, 3), MakeRequest("b", 20, 10, 5, 2, 4)};
  ProductRequests backward = {forward[1], forward[0]};

  const auto a = BuildCacheKey(NormalizeAll(forward), kContainer, kPallet, "ok");
  const auto b = BuildCacheKey(NormalizeAll(backward), kContainer, kPallet, "ok");
  assert(a == b);
  assert(KeyDigest(a) == KeyDigest(b));
  assert(KeyDigest(a).size() == 16);
}

void TestZeroQuantityLinesAreIgnored() {
  ProductRequests plain     = {MakeRequest("a", 10, 10, 10, 1, 3)};
  ProductRequests with_zero = {MakeRequest("a", 10, 10, 10, 1, 3), MakeRequest("z", 5, 5, 5, 1, 0)};

  assert(BuildCacheKey(NormalizeAll(plain), kContainer, kPallet, "ok") == BuildCacheKey(NormalizeAll(with_zero), kContainer, kPallet, "ok"));
}

void TestEveryInputContributes() {
  ProductRequests requests = {MakeRequest("a", 10, 10, 10, 1, 3)};
  ProductRequests more     = {MakeRequest("a", 10, 10, 10, 1, 4)};
  const auto      items    = NormalizeAll(requests);
  const auto      base     = BuildCacheKey(items, kContainer, kPallet, "ok");

  assert(base != BuildCacheKey(NormalizeAll(more), kContainer, kPallet, "ok"));
  assert(base != BuildCacheKey(items, MakeContainer(100, 100, 100, 900), kPallet, "ok"));
  assert(base != BuildCacheKey(items, kContainer, MakePallet(80, 80, 15, 12, 500), "ok"));
  assert(base != BuildCacheKey(items, kContainer, kPallet, "done"));
}

} // namespace

int main() {
  TestRequestOrderDoesNotChangeKey();
  TestZeroQuantityLinesAreIgnored();
  TestEveryInputContributes();

  std::cout << "loadplan_unit_cache_key: pass\n";
  return 0;
}
