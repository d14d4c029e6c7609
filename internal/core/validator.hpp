#pragma once

#include <optional>
#include <string>

#include "internal/core/model.hpp"
#include "loadplan/core/v1/types.pb.h"

namespace loadplan::core {

/*
  Input checks run before any packing.

  Every failing request is reported, not just the first one. Identifiers
  prefer the product name, then sku, then id.
*/
loadplan::core::v1::ValidationResult ValidateProducts(const ProductRequests& requests);

// Reason the request is unusable, or nullopt when it is fine.
std::optional<std::string> ProductDefect(const loadplan::core::v1::ProductRequest& request);

std::string ProductIdentifier(const loadplan::core::v1::Product& product);

std::optional<std::string> ContainerDefect(const loadplan::core::v1::Container& container);
std::optional<std::string> PalletDefect(const loadplan::core::v1::PalletTemplate& pallet);

} // namespace loadplan::core
