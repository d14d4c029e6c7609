#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/core/model.hpp"
#include "loadplan/core/v1/types.pb.h"

namespace loadplan::cache {

/*
  Memoization key for one optimization.

  Built from the canonical bytes of every positive-quantity request, sorted
  so that the caller's ordering does not matter, followed by the container,
  the pallet template and the success message. Each part is length-prefixed.
*/
std::string BuildCacheKey(const std::vector<loadplan::core::NormalizedRequest>& requests, const loadplan::core::v1::Container& container,
                          const loadplan::core::v1::PalletTemplate& pallet, std::string_view success_message);

// Short hex digest, for log lines only.
std::string KeyDigest(std::string_view key);

} // namespace loadplan::cache
