#include "cache_key.hpp"

#include <algorithm>
#include <cstdio>
#include <functional>

#include "internal/core/units.hpp"

namespace loadplan::cache {

namespace {

void AppendPart(std::string& key, std::string_view part) {
  key.append(std::to_string(part.size()));
  key.push_back(':');
  key.append(part);
}

} // namespace

std::string BuildCacheKey(const std::vector<loadplan::core::NormalizedRequest>& requests, const loadplan::core::v1::Container& container,
                          const loadplan::core::v1::PalletTemplate& pallet, std::string_view success_message) {
  std::vector<std::string_view> parts;
  parts.reserve(requests.size());
  for (const auto& request : requests) {
    if (request.quantity > 0) {
      parts.emplace_back(request.canonical);
    }
  }
  std::sort(parts.begin(), parts.end());

  std::string key;
  AppendPart(key, std::to_string(parts.size()));
  for (const auto part : parts) {
    AppendPart(key, part);
  }
  AppendPart(key, loadplan::core::CanonicalBytes(container));
  AppendPart(key, loadplan::core::CanonicalBytes(pallet));
  AppendPart(key, success_message);
  return key;
}

std::string KeyDigest(std::string_view key) {
  char buffer[17];
  std::snprintf(buffer, sizeof(buffer), "%016zx", std::hash<std::string_view>{}(key));
  return buffer;
}

} // namespace loadplan::cache
