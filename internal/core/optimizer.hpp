#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/model.hpp"
#include "internal/core/placement_engine.hpp"
#include "internal/core/result_assembler.hpp"
#include "loadplan/core/v1/types.pb.h"

namespace loadplan::cache {
class ResultCache;
}

namespace loadplan::core {

struct OptimizerOptions {
  EngineOptions engine;
  // Empty means the built-in success message.
  std::string   success_message;
};

struct OptimizeOutcome {
  std::shared_ptr<const loadplan::core::v1::OptimizationResult> result;
  bool                                                          cache_hit{false};
};

/*
  Entry point of the packing pipeline:

    filter -> validate -> normalize -> cache lookup -> pack -> measure -> assemble

  Input failures are returned inside the result, never thrown. Successful
  results are memoized when a cache is attached. Safe for concurrent use;
  the cache is the only shared mutable state.
*/
class Optimizer {
 public:
  explicit Optimizer(OptimizerOptions options = {}, std::shared_ptr<loadplan::cache::ResultCache> cache = nullptr);

  loadplan::core::v1::ValidationResult ValidateProducts(const ProductRequests& requests) const;

  OptimizeOutcome Optimize(const ProductRequests& requests, const loadplan::core::v1::Container& container,
                           const loadplan::core::v1::PalletTemplate& pallet,
                           const std::optional<std::string>&         success_message = std::nullopt);

  std::uint64_t optimizations() const {
    return optimizations_.load(std::memory_order_relaxed);
  }

  const std::shared_ptr<loadplan::cache::ResultCache>& cache() const {
    return cache_;
  }

 private:
  OptimizeOutcome Finish(loadplan::core::v1::OptimizationResult result) const;

  PlacementEngine                               engine_;
  ResultAssembler                               assembler_;
  std::shared_ptr<loadplan::cache::ResultCache> cache_;

  std::atomic<std::uint64_t> optimizations_{0};
};

} // namespace loadplan::core
