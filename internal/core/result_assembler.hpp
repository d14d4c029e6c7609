#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/model.hpp"
#include "internal/core/placement_engine.hpp"
#include "internal/core/utilization.hpp"
#include "loadplan/core/v1/types.pb.h"

namespace loadplan::core {

inline constexpr std::string_view kDefaultSuccessMessage = "Optimization completed successfully";
inline constexpr std::string_view kEmptyInputMessage     = "No products to optimize";

/*
  Turns engine output into the OptimizationResult handed to callers.

  Failures never carry arrangements; every positive-quantity request is
  reported back as remaining so placed + remaining still adds up.
*/
class ResultAssembler {
 public:
  explicit ResultAssembler(std::string default_success_message = std::string(kDefaultSuccessMessage));

  loadplan::core::v1::OptimizationResult EmptyInput() const;

  loadplan::core::v1::OptimizationResult InvalidProducts(const loadplan::core::v1::ValidationResult& validation,
                                                         const std::vector<NormalizedRequest>&       requests) const;

  loadplan::core::v1::OptimizationResult InvalidContainer(std::string_view reason, const std::vector<NormalizedRequest>& requests) const;
  loadplan::core::v1::OptimizationResult InvalidPallet(std::string_view reason, const std::vector<NormalizedRequest>& requests) const;

  loadplan::core::v1::OptimizationResult Oversized(const Oversize& oversize, const std::vector<NormalizedRequest>& requests) const;

  loadplan::core::v1::OptimizationResult Success(const PlacementPlan& plan, const UtilizationReport& report,
                                                 const loadplan::core::v1::PalletTemplate& pallet,
                                                 const std::optional<std::string>&         success_message) const;

  const std::string& default_success_message() const {
    return default_success_message_;
  }

 private:
  std::string default_success_message_;
};

// Display projection of a result. Only meaningful for pallet and weight
// figures when result.success() is true.
loadplan::core::v1::OptimizationSummary PrepareSummary(const loadplan::core::v1::OptimizationResult& result);

} // namespace loadplan::core
