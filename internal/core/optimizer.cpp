#include "optimizer.hpp"

#include <utility>

#include "internal/cache/cache_key.hpp"
#include "internal/cache/result_cache.hpp"
#include "internal/core/units.hpp"
#include "internal/core/utilization.hpp"
#include "internal/core/validator.hpp"
#include "internal/observability/logging.hpp"

namespace loadplan::core {

using namespace loadplan::core::v1;

namespace {

std::vector<NormalizedRequest> NormalizeAll(const ProductRequests& requests) {
  std::vector<NormalizedRequest> normalized;
  normalized.reserve(requests.size());
  for (const auto& request : requests) {
    normalized.push_back(NormalizeRequest(request));
  }
  return normalized;
}

} // namespace

Optimizer::Optimizer(OptimizerOptions options, std::shared_ptr<loadplan::cache::ResultCache> cache)
    : engine_(options.engine), assembler_(std::move(options.success_message)), cache_(std::move(cache)) {
}

ValidationResult Optimizer::ValidateProducts(const ProductRequests& requests) const {
  return loadplan::core::ValidateProducts(requests);
}

OptimizeOutcome Optimizer::Finish(OptimizationResult result) const {
  return OptimizeOutcome{std::make_shared<const OptimizationResult>(std::move(result)), false};
}

OptimizeOutcome Optimizer::Optimize(const ProductRequests& requests, const Container& container, const PalletTemplate& pallet,
                                    const std::optional<std::string>& success_message) {
  optimizations_.fetch_add(1, std::memory_order_relaxed);

  // Zero-quantity lines carry nothing to pack.
  ProductRequests active;
  active.reserve(requests.size());
  for (const auto& request : requests) {
    if (request.quantity() != 0) {
      active.push_back(request);
    }
  }
  if (active.empty()) {
    LOADPLAN_LOG_DEBUG("optimize: empty input", {loadplan::observability::IntField("requests", static_cast<std::int64_t>(requests.size()))});
    return Finish(assembler_.EmptyInput());
  }

  const auto validation = loadplan::core::ValidateProducts(active);
  if (!validation.valid()) {
    LOADPLAN_LOG_DEBUG("optimize: invalid products",
                       {loadplan::observability::IntField("invalid", validation.invalid_products_size())});
    return Finish(assembler_.InvalidProducts(validation, NormalizeAll(active)));
  }

  auto normalized = NormalizeAll(active);

  if (auto defect = ContainerDefect(container)) {
    return Finish(assembler_.InvalidContainer(*defect, normalized));
  }
  if (auto defect = PalletDefect(pallet)) {
    return Finish(assembler_.InvalidPallet(*defect, normalized));
  }

  const std::string message = success_message && !success_message->empty() ? *success_message : assembler_.default_success_message();

  std::string key;
  if (cache_) {
    key = loadplan::cache::BuildCacheKey(normalized, container, pallet, message);
    if (auto hit = cache_->Get(key)) {
      LOADPLAN_LOG_DEBUG("optimize: cache hit", {loadplan::observability::StringField("key", loadplan::cache::KeyDigest(key))});
      return OptimizeOutcome{std::move(hit), true};
    }
  }

  const auto hold = NormalizeContainer(container);
  const auto deck = NormalizePallet(pallet);
  const auto plan = engine_.Pack(normalized, hold, deck);

  if (plan.oversize) {
    return Finish(assembler_.Oversized(*plan.oversize, normalized));
  }

  const auto report = ComputeUtilization(plan, hold, deck);
  auto       result = std::make_shared<const OptimizationResult>(assembler_.Success(plan, report, pallet, message));

  LOADPLAN_LOG_DEBUG("optimize: packed", {loadplan::observability::IntField("pallets", static_cast<std::int64_t>(plan.pallets.size())),
                                          loadplan::observability::IntField("remaining_lines", static_cast<std::int64_t>(plan.remaining.size())),
                                          loadplan::observability::DoubleField("utilization", report.overall)});

  if (cache_) {
    cache_->Put(key, result);
  }
  return OptimizeOutcome{std::move(result), false};
}

} // namespace loadplan::core
