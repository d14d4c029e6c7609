#include "internal/core/utilization.hpp"

#include <cassert>
#include <iostream>
#include <limits>

#include "internal/core/units.hpp"
#include "tests/support/load_plan_fixtures.hpp"

namespace {

using namespace loadplan::core;
using loadplan::testing::MakeContainer;
using loadplan::testing::MakePallet;
using loadplan::testing::MakeRequest;
using loadplan::testing::Near;

void TestClampAndRound() {
  assert(ClampPercent(std::numeric_limits<double>::quiet_NaN()) == 0.0);
  assert(ClampPercent(std::numeric_limits<double>::infinity()) == 0.0);
  assert(ClampPercent(150.0) == 100.0);
  assert(ClampPercent(-3.0) == 0.0);
  assert(ClampPercent(42.5) == 42.5);

  assert(Near(RoundForDisplay(12.3456), 12.35));
  assert(Near(RoundForDisplay(1.838235), 1.84));
  assert(Near(RoundForDisplay(100.0), 100.0));
}

void TestExampleScenarioFigures() {
  ProductRequests requests  = {MakeRequest("cube", 10, 10, 10, 1, 10)};
  const auto      container = NormalizeContainer(MakeContainer(100, 100, 100, 1000));
  const auto      pallet    = NormalizePallet(MakePallet(80, 80, 15, 10, 500));

  std::vector<NormalizedRequest> items  = {NormalizeRequest(requests[0])};
  const auto                     plan   = PlacementEngine().Pack(items, container, pallet);
  const auto                     report = ComputeUtilization(plan, container, pallet);

  assert(Near(report.overall, 1.0));
  assert(report.per_pallet.size() == 1);
  assert(Near(report.per_pallet[0], 10000.0 / (80.0 * 80.0 * 85.0) * 100.0));
  assert(report.weight.has_value());
  assert(Near(*report.weight, 2.0));
  assert(Near(report.total_weight, 20.0));
  assert(report.pallet_weights.size() == 1 && Near(report.pallet_weights[0], 20.0));
}

void TestWeightAbsentWithoutContainerLimit() {
  ProductRequests requests  = {MakeRequest("cube", 10, 10, 10, 1, 3)};
  const auto      container = NormalizeContainer(MakeContainer(100, 100, 100));
  const auto      pallet    = NormalizePallet(MakePallet(80, 80, 15, 10));

  std::vector<NormalizedRequest> items  = {NormalizeRequest(requests[0])};
  const auto                     plan   = PlacementEngine().Pack(items, container, pallet);
  const auto                     report = ComputeUtilization(plan, container, pallet);

  assert(!report.weight.has_value());
  assert(report.overall > 0.0 && report.overall <= 100.0);
}

void TestEmptyPlanMeasuresZero() {
  const auto container = NormalizeContainer(MakeContainer(100, 100, 100, 500));
  const auto pallet    = NormalizePallet(MakePallet(80, 80, 15, 10));

  const auto report = ComputeUtilization(PlacementPlan{}, container, pallet);
  assert(report.overall == 0.0);
  assert(report.per_pallet.empty());
  assert(report.weight.has_value() && *report.weight == 0.0);
}

} // namespace

int main() {
  TestClampAndRound();
  TestExampleScenarioFigures();
  TestWeightAbsentWithoutContainerLimit();
  TestEmptyPlanMeasuresZero();

  std::cout << "loadplan_unit_utilization: pass\n";
  return 0;
}
