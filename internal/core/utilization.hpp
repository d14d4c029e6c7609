#pragma once

#include <optional>
#include <vector>

#include "internal/core/model.hpp"
#include "internal/core/placement_engine.hpp"

namespace loadplan::core {

struct UtilizationReport {
  // Percentages in [0, 100], full precision.
  double                overall{0.0};
  std::vector<double>   per_pallet;
  std::optional<double> weight;

  // Kilograms, tare included.
  double              total_weight{0.0};
  std::vector<double> pallet_weights;
};

UtilizationReport ComputeUtilization(const PlacementPlan& plan, const NormalizedContainer& container, const NormalizedPallet& pallet);

double ClampPercent(double value);

// Two decimals, for display only.
double RoundForDisplay(double percent);

} // namespace loadplan::core
