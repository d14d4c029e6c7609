#include "load_plan_service.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "internal/cache/result_cache.hpp"
#include "internal/core/optimizer.hpp"
#include "internal/core/result_assembler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace loadplan::service {

using namespace loadplan::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = loadplan::util::Now();
  try {
    auto result = fn();
    LOADPLAN_LOG_DEBUG("RPC completed", {loadplan::observability::StringField("route", route),
                                         loadplan::observability::DoubleField("latency_ms", loadplan::util::ElapsedMillis(started_at))});
    return result;
  } catch (const std::exception& ex) {
    LOADPLAN_LOG_ERROR("RPC failed", {loadplan::observability::StringField("route", route), loadplan::observability::StringField("error", ex.what()),
                                      loadplan::observability::DoubleField("latency_ms", loadplan::util::ElapsedMillis(started_at))});
    throw;
  }
}

loadplan::core::ProductRequests ToRequests(const google::protobuf::RepeatedPtrField<ProductRequest>& products) {
  return loadplan::core::ProductRequests(products.begin(), products.end());
}

} // namespace

LoadPlanService::LoadPlanService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.optimizer) {
    throw loadplan::util::InvalidArgument("load plan service: optimizer is required");
  }
}

// ------------------------------------------------------------
// ValidateProducts
// ------------------------------------------------------------

ValidateProductsResponse LoadPlanService::ValidateProducts(const ValidateProductsRequest& req) {
  return ObserveRpc("ValidateProducts", [&] {
    ValidateProductsResponse resp;
    *resp.mutable_validation() = ctx_.optimizer->ValidateProducts(ToRequests(req.products()));
    return resp;
  });
}

// ------------------------------------------------------------
// Optimize
// ------------------------------------------------------------

OptimizeResponse LoadPlanService::Optimize(const OptimizeRequest& req) {
  return ObserveRpc("Optimize", [&] {
    if (!req.has_container()) {
      throw loadplan::util::InvalidArgument("optimize: container is required");
    }

    const PalletTemplate* pallet = nullptr;
    if (req.has_pallet()) {
      pallet = &req.pallet();
    } else if (ctx_.default_pallet) {
      pallet = &*ctx_.default_pallet;
    } else {
      throw loadplan::util::InvalidArgument("optimize: pallet is required and no default pallet is configured");
    }

    std::optional<std::string> success_message;
    if (req.has_success_message()) {
      success_message = req.success_message();
    }

    auto outcome = ctx_.optimizer->Optimize(ToRequests(req.products()), req.container(), *pallet, success_message);

    OptimizeResponse resp;
    *resp.mutable_result() = *outcome.result;
    resp.set_cache_hit(outcome.cache_hit);
    return resp;
  });
}

// ------------------------------------------------------------
// PrepareSummary
// ------------------------------------------------------------

PrepareSummaryResponse LoadPlanService::PrepareSummary(const PrepareSummaryRequest& req) {
  return ObserveRpc("PrepareSummary", [&] {
    PrepareSummaryResponse resp;
    *resp.mutable_summary() = loadplan::core::PrepareSummary(req.result());
    return resp;
  });
}

// ------------------------------------------------------------
// GetStats
// ------------------------------------------------------------

GetStatsResponse LoadPlanService::GetStats(const GetStatsRequest&) {
  return ObserveRpc("GetStats", [&] {
    GetStatsResponse resp;
    resp.set_optimizations(ctx_.optimizer->optimizations());
    if (ctx_.cache) {
      const auto stats = ctx_.cache->GetStats();
      resp.set_cache_hits(stats.hits);
      resp.set_cache_misses(stats.misses);
      resp.set_cache_entries(stats.entries);
    }
    return resp;
  });
}

} // namespace loadplan::service
