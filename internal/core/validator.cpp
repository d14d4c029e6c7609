#include "validator.hpp"

#include <cmath>

#include "internal/core/units.hpp"

namespace loadplan::core {

using namespace loadplan::core::v1;

namespace {

std::optional<std::string> DimensionsDefect(bool present, const Dimensions& dimensions) {
  if (!present) {
    return "missing dimensions";
  }
  if (!IsKnownUnit(dimensions.unit())) {
    return "unknown unit";
  }

  const double components[] = {dimensions.length(), dimensions.width(), dimensions.height()};
  for (double component : components) {
    if (!std::isfinite(component) || component <= 0.0) {
      return "dimensions must be positive";
    }
  }
  return std::nullopt;
}

bool IsPositiveFinite(double value) {
  return std::isfinite(value) && value > 0.0;
}

} // namespace

std::string ProductIdentifier(const Product& product) {
  if (!product.name().empty()) return product.name();
  if (!product.sku().empty()) return product.sku();
  if (!product.id().empty()) return product.id();
  return "Unknown product";
}

std::optional<std::string> ProductDefect(const ProductRequest& request) {
  const auto& product = request.product();

  if (auto defect = DimensionsDefect(product.has_dimensions(), product.dimensions())) {
    return defect;
  }
  if (!product.has_weight()) {
    return "missing weight";
  }
  if (!std::isfinite(product.weight()) || product.weight() < 0.0) {
    return "weight must be non-negative";
  }
  if (request.quantity() < 0) {
    return "quantity must be non-negative";
  }
  return std::nullopt;
}

ValidationResult ValidateProducts(const ProductRequests& requests) {
  ValidationResult result;
  for (const auto& request : requests) {
    if (ProductDefect(request)) {
      result.add_invalid_products(ProductIdentifier(request.product()));
    }
  }
  result.set_valid(result.invalid_products().empty());
  return result;
}

std::optional<std::string> ContainerDefect(const Container& container) {
  if (auto defect = DimensionsDefect(container.has_dimensions(), container.dimensions())) {
    return defect;
  }
  if (container.has_max_weight() && !IsPositiveFinite(container.max_weight())) {
    return "max_weight must be positive";
  }
  return std::nullopt;
}

std::optional<std::string> PalletDefect(const PalletTemplate& pallet) {
  if (auto defect = DimensionsDefect(pallet.has_dimensions(), pallet.dimensions())) {
    return defect;
  }
  if (!std::isfinite(pallet.tare_weight()) || pallet.tare_weight() < 0.0) {
    return "tare_weight must be non-negative";
  }
  if (pallet.has_max_weight() && !IsPositiveFinite(pallet.max_weight())) {
    return "max_weight must be positive";
  }
  return std::nullopt;
}

} // namespace loadplan::core
