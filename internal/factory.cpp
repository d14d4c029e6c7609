#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/result_cache.hpp"
#include "internal/core/optimizer.hpp"
#include "internal/core/validator.hpp"
#include "internal/grpc/load_plan_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/load_plan_service.hpp"

namespace loadplan::factory {

using namespace loadplan;

namespace {

core::PalletLayout ToLayout(runtime::config::PalletLayout layout) {
  switch (layout) {
    case runtime::config::PALLET_LAYOUT_UNSPECIFIED:
    case runtime::config::PALLET_LAYOUT_STACKED:
      return core::PalletLayout::kStacked;
    case runtime::config::PALLET_LAYOUT_FLOOR_GRID:
      return core::PalletLayout::kFloorGrid;
    default:
      throw std::runtime_error("engine.pallet_layout: unsupported value " + std::to_string(static_cast<int>(layout)));
  }
}

core::OptimizerOptions BuildOptimizerOptions(const runtime::config::EngineConfig& engine) {
  core::OptimizerOptions options;
  options.engine.layout                   = ToLayout(engine.pallet_layout());
  options.engine.allow_footprint_rotation = engine.allow_footprint_rotation();
  if (engine.epsilon_cm() != 0.0) {
    options.engine.epsilon = engine.epsilon_cm();
  }
  options.success_message = engine.success_message();
  return options;
}

std::shared_ptr<cache::ResultCache> BuildCache(const runtime::config::CacheConfig& config) {
  if (config.disabled()) {
    return nullptr;
  }

  cache::ResultCacheOptions options;
  if (config.max_entries() != 0) {
    options.max_entries = config.max_entries();
  }
  options.ttl = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(config.ttl_ms()));
  return std::make_shared<cache::ResultCache>(options);
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const loadplan::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto& engine = config.engine();

  auto result_cache = BuildCache(config.cache());
  auto optimizer    = std::make_shared<core::Optimizer>(BuildOptimizerOptions(engine), result_cache);

  if (engine.has_default_pallet()) {
    if (auto defect = core::PalletDefect(engine.default_pallet())) {
      throw std::runtime_error("engine.default_pallet: " + *defect);
    }
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context.optimizer = optimizer;
  app.context.cache     = result_cache;
  if (engine.has_default_pallet()) {
    app.context.default_pallet = engine.default_pallet();
  }

  app.load_plan_service = std::make_shared<service::LoadPlanService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<loadplan::grpc::LoadPlanServer>(app.load_plan_service));

  LOADPLAN_LOG_INFO("Application built", {observability::BoolField("cache_enabled", result_cache != nullptr),
                                          observability::BoolField("footprint_rotation", engine.allow_footprint_rotation()),
                                          observability::BoolField("default_pallet", engine.has_default_pallet())});
  return app;
}

} // namespace loadplan::factory
