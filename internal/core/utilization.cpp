#include "utilization.hpp"

#include <algorithm>
#include <cmath>

namespace loadplan::core {

double ClampPercent(double value) {
  if (!std::isfinite(value)) {
    return 0.0;
  }
  return std::clamp(value, 0.0, 100.0);
}

double RoundForDisplay(double percent) {
  return std::round(percent * 100.0) / 100.0;
}

UtilizationReport ComputeUtilization(const PlacementPlan& plan, const NormalizedContainer& container, const NormalizedPallet& pallet) {
  UtilizationReport report;

  const double container_volume = container.box.Volume();

  double placed_volume = 0.0;
  for (const auto& packed : plan.pallets) {
    placed_volume += packed.goods_volume;

    const double pallet_load_volume = pallet.box.FootprintArea() * packed.slot.usable_height;
    const double pallet_percent = pallet_load_volume > 0.0 ? packed.goods_volume / pallet_load_volume * 100.0 : 0.0;
    report.per_pallet.push_back(ClampPercent(pallet_percent));

    const double pallet_weight = pallet.tare_weight + packed.goods_weight;
    report.pallet_weights.push_back(pallet_weight);
    report.total_weight += pallet_weight;
  }

  report.overall = container_volume > 0.0 ? ClampPercent(placed_volume / container_volume * 100.0) : 0.0;

  if (container.max_weight && *container.max_weight > 0.0) {
    report.weight = ClampPercent(report.total_weight / *container.max_weight * 100.0);
  }
  return report;
}

} // namespace loadplan::core
