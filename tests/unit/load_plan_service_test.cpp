#include "internal/service/load_plan_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/cache/result_cache.hpp"
#include "internal/core/optimizer.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/load_plan_fixtures.hpp"

namespace {

using namespace loadplan::v1;
using loadplan::service::LoadPlanService;
using loadplan::service::ServiceContext;
using loadplan::testing::MakeContainer;
using loadplan::testing::MakePallet;
using loadplan::testing::MakeRequest;
using loadplan::testing::Near;

ServiceContext BuildServiceContext(bool with_default_pallet) {
  ServiceContext ctx;
  ctx.cache     = std::make_shared<loadplan::cache::ResultCache>();
  ctx.optimizer = std::make_shared<loadplan::core::Optimizer>(loadplan::core::OptimizerOptions{}, ctx.cache);
  if (with_default_pallet) {
    ctx.default_pallet = MakePallet(120, 100, 15, 20, 1000);
  }
  return ctx;
}

OptimizeRequest CubeRequest() {
  OptimizeRequest req;
  *req.add_products()      = MakeRequest("cube", 10, 10, 10, 1, 10);
  *req.mutable_container() = MakeContainer(200, 200, 100, 2000);
  return req;
}

void TestValidateProducts() {
  LoadPlanService service(BuildServiceContext(false));

  ValidateProductsRequest req;
  *req.add_products() = MakeRequest("good", 1, 1, 1, 1, 1);
  *req.add_products() = MakeRequest("bad", -1, 1, 1, 1, 1);

  const auto resp = service.ValidateProducts(req);
  assert(!resp.validation().valid());
  assert(resp.validation().invalid_products_size() == 1);
  assert(resp.validation().invalid_products(0) == "Product bad");
}

void TestMissingPalletFallsBackToDefault() {
  LoadPlanService service(BuildServiceContext(true));

  const auto resp = service.Optimize(CubeRequest());
  assert(resp.result().success());
  assert(!resp.cache_hit());
  assert(resp.result().pallet_arrangements_size() == 1);
  assert(resp.result().pallet_arrangements(0).pallet().dimensions().length() == 120.0);
}

void TestMissingPalletWithoutDefaultThrows() {
  LoadPlanService service(BuildServiceContext(false));

  bool threw = false;
  try {
    (void)service.Optimize(CubeRequest());
  } catch (const loadplan::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSuccessMessageOverride() {
  LoadPlanService service(BuildServiceContext(true));

  auto req = CubeRequest();
  req.set_success_message("Truck 7 planned");
  const auto resp = service.Optimize(req);
  assert(resp.result().message() == "Truck 7 planned");
}

void TestSummaryAndStats() {
  LoadPlanService service(BuildServiceContext(true));

  const auto first  = service.Optimize(CubeRequest());
  const auto second = service.Optimize(CubeRequest());
  assert(!first.cache_hit());
  assert(second.cache_hit());

  PrepareSummaryRequest summary_req;
  *summary_req.mutable_result() = second.result();
  const auto summary = service.PrepareSummary(summary_req).summary();
  assert(summary.success());
  assert(summary.total_pallets() == 1);
  assert(summary.total_products() == 10);
  assert(summary.remaining_products() == 0);
  assert(Near(summary.utilization(), 0.25));
  assert(summary.has_weight_utilization());
  assert(Near(summary.weight_utilization(), 1.5));

  const auto stats = service.GetStats(GetStatsRequest{});
  assert(stats.optimizations() == 2);
  assert(stats.cache_hits() == 1);
  assert(stats.cache_misses() == 1);
  assert(stats.cache_entries() == 1);
}

void TestOptimizerIsRequired() {
  bool threw = false;
  try {
    LoadPlanService service(ServiceContext{});
    (void)service;
  } catch (const loadplan::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestValidateProducts();
  TestMissingPalletFallsBackToDefault();
  TestMissingPalletWithoutDefaultThrows();
  TestSuccessMessageOverride();
  TestSummaryAndStats();
  TestOptimizerIsRequired();

  std::cout << "loadplan_unit_load_plan_service: pass\n";
  return 0;
}
