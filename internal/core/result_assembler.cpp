#include "result_assembler.hpp"

#include <sstream>

#include "internal/core/validator.hpp"

namespace loadplan::core {

using namespace loadplan::core::v1;

namespace {

constexpr double kQuarterTurnDegrees = 90.0;

OptimizationResult Failure(OptimizationStatus status, std::string message, const std::vector<NormalizedRequest>& requests) {
  OptimizationResult result;
  result.set_success(false);
  result.set_status(status);
  result.set_message(std::move(message));
  result.set_utilization(0.0);

  for (const auto& request : requests) {
    if (request.quantity <= 0) {
      continue;
    }
    auto* remaining                = result.add_remaining_products();
    *remaining->mutable_product() = request.product();
    remaining->set_quantity(request.quantity);
  }
  return result;
}

void SetPosition(const Vec3& from, Position* to) {
  to->set_x(from.x);
  to->set_y(from.y);
  to->set_z(from.z);
}

} // namespace

ResultAssembler::ResultAssembler(std::string default_success_message) : default_success_message_(std::move(default_success_message)) {
  if (default_success_message_.empty()) {
    default_success_message_ = std::string(kDefaultSuccessMessage);
  }
}

OptimizationResult ResultAssembler::EmptyInput() const {
  return Failure(OPTIMIZATION_STATUS_EMPTY_INPUT, std::string(kEmptyInputMessage), {});
}

OptimizationResult ResultAssembler::InvalidProducts(const ValidationResult& validation, const std::vector<NormalizedRequest>& requests) const {
  std::ostringstream message;
  message << "Invalid products: ";
  for (int i = 0; i < validation.invalid_products_size(); ++i) {
    if (i > 0) message << ", ";
    message << validation.invalid_products(i);
  }

  auto result = Failure(OPTIMIZATION_STATUS_INVALID_PRODUCT, message.str(), requests);
  *result.mutable_invalid_products() = validation.invalid_products();
  return result;
}

OptimizationResult ResultAssembler::InvalidContainer(std::string_view reason, const std::vector<NormalizedRequest>& requests) const {
  return Failure(OPTIMIZATION_STATUS_INVALID_CONTAINER, "Invalid container: " + std::string(reason), requests);
}

OptimizationResult ResultAssembler::InvalidPallet(std::string_view reason, const std::vector<NormalizedRequest>& requests) const {
  return Failure(OPTIMIZATION_STATUS_INVALID_PALLET, "Invalid pallet template: " + std::string(reason), requests);
}

OptimizationResult ResultAssembler::Oversized(const Oversize& oversize, const std::vector<NormalizedRequest>& requests) const {
  std::string message;
  switch (oversize.kind) {
    case Oversize::Kind::kPalletForContainer:
      message = "Pallet template is too large for the container";
      break;
    case Oversize::Kind::kProductForContainer:
      message = "Product " + ProductIdentifier(oversize.request->product()) + " is too large for the container";
      break;
    case Oversize::Kind::kProductForPallet:
      message = "Product " + ProductIdentifier(oversize.request->product()) + " is too large for the pallet";
      break;
  }
  return Failure(OPTIMIZATION_STATUS_OVERSIZED, std::move(message), requests);
}

OptimizationResult ResultAssembler::Success(const PlacementPlan& plan, const UtilizationReport& report, const PalletTemplate& pallet,
                                            const std::optional<std::string>& success_message) const {
  OptimizationResult result;
  result.set_success(true);
  result.set_status(OPTIMIZATION_STATUS_OK);
  result.set_message(success_message && !success_message->empty() ? *success_message : default_success_message_);
  result.set_utilization(report.overall);
  if (report.weight) {
    result.set_weight_utilization(*report.weight);
  }

  for (std::size_t i = 0; i < plan.pallets.size(); ++i) {
    const auto& packed      = plan.pallets[i];
    auto*       arrangement = result.add_pallet_arrangements();

    arrangement->set_index(static_cast<std::uint32_t>(packed.slot.index));
    *arrangement->mutable_pallet() = pallet;
    SetPosition(packed.slot.origin, arrangement->mutable_origin());
    arrangement->mutable_rotation()->set_z(packed.slot.turned ? kQuarterTurnDegrees : 0.0);
    arrangement->set_weight(report.pallet_weights[i]);
    arrangement->set_utilization(report.per_pallet[i]);

    for (const auto& run : packed.runs) {
      auto* placement = arrangement->add_placements();
      placement->set_product_id(run.request->product().id());
      placement->set_quantity(run.quantity);
      SetPosition(run.position, placement->mutable_position());
      placement->mutable_rotation()->set_z(run.turned ? kQuarterTurnDegrees : 0.0);
    }
  }

  for (const auto& remainder : plan.remaining) {
    auto* remaining                = result.add_remaining_products();
    *remaining->mutable_product() = remainder.request->product();
    remaining->set_quantity(remainder.quantity);
  }
  return result;
}

OptimizationSummary PrepareSummary(const OptimizationResult& result) {
  OptimizationSummary summary;
  summary.set_success(result.success());
  if (result.has_message()) {
    summary.set_message(result.message());
  }
  summary.set_utilization(RoundForDisplay(result.utilization()));
  summary.set_total_pallets(static_cast<std::uint32_t>(result.pallet_arrangements_size()));

  std::int64_t placed = 0;
  for (const auto& arrangement : result.pallet_arrangements()) {
    for (const auto& placement : arrangement.placements()) {
      placed += placement.quantity();
    }
  }
  summary.set_total_products(placed);

  std::int64_t remaining = 0;
  for (const auto& request : result.remaining_products()) {
    remaining += request.quantity();
  }
  summary.set_remaining_products(remaining);

  if (result.has_weight_utilization()) {
    summary.set_weight_utilization(RoundForDisplay(result.weight_utilization()));
  }
  return summary;
}

} // namespace loadplan::core
