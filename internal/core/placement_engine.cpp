#include "placement_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/util/errors.hpp"

namespace loadplan::core {

namespace {

constexpr double       kWeightTolerance = 1e-9;
constexpr std::int64_t kUnbounded       = std::numeric_limits<std::int64_t>::max();

struct RowRun {
  Vec3         position;
  std::int64_t count{0};
};

/*
  Row/layer cursor over one pallet deck.

  Units go left to right along x; a full row moves the cursor to the next row
  at y + row depth; a full layer moves it to z + layer height.
*/
class ShelfCursor {
 public:
  ShelfCursor(const Box& deck, double usable_height, double epsilon)
      : deck_(deck), usable_height_(usable_height), epsilon_(epsilon) {
  }

  // Reserves up to max_units identical units in one row. Leaves the cursor
  // untouched when no unit fits.
  std::optional<RowRun> Reserve(const Box& unit, std::int64_t max_units) {
    double x            = x_;
    double y            = y_;
    double z            = z_;
    double row_depth    = row_depth_;
    double layer_height = layer_height_;

    for (;;) {
      if (!Fits(z, unit.height, usable_height_)) {
        return std::nullopt;
      }

      if (!Fits(y, unit.length, deck_.length)) {
        if (x == 0.0 && y == 0.0) {
          return std::nullopt;
        }
        z += layer_height;
        x = y = row_depth = layer_height = 0.0;
        continue;
      }

      const auto across = CountAcross(deck_.width - x, unit.width);
      if (across == 0) {
        if (x == 0.0) {
          return std::nullopt;
        }
        y += row_depth;
        x = row_depth = 0.0;
        continue;
      }

      RowRun run;
      run.position = Vec3{x, y, z};
      run.count    = std::min(across, max_units);

      load_height_ = std::max(load_height_, z + unit.height);

      x_            = x + static_cast<double>(run.count) * unit.width;
      y_            = y;
      z_            = z;
      row_depth_    = std::max(row_depth, unit.length);
      layer_height_ = std::max(layer_height, unit.height);
      return run;
    }
  }

  double load_height() const {
    return load_height_;
  }

 private:
  bool Fits(double offset, double extent, double limit) const {
    return offset + extent <= limit + epsilon_;
  }

  std::int64_t CountAcross(double available, double extent) const {
    if (available + epsilon_ < extent) {
      return 0;
    }
    const double count = std::floor((available + epsilon_) / extent);
    return count >= static_cast<double>(kUnbounded) ? kUnbounded : static_cast<std::int64_t>(count);
  }

  Box    deck_;
  double usable_height_;
  double epsilon_;

  double x_{0.0};
  double y_{0.0};
  double z_{0.0};
  double row_depth_{0.0};
  double layer_height_{0.0};
  double load_height_{0.0};
};

std::int64_t UnitsWithin(double capacity, double load, double unit_weight) {
  const double headroom = capacity - load + kWeightTolerance;
  if (headroom < 0.0) {
    return 0;
  }
  if (unit_weight <= 0.0) {
    return kUnbounded;
  }
  if (headroom < unit_weight) {
    return 0;
  }
  const double count = std::floor(headroom / unit_weight);
  return count >= static_cast<double>(kUnbounded) ? kUnbounded : static_cast<std::int64_t>(count);
}

struct Pending {
  const NormalizedRequest* request{nullptr};
  std::int64_t             remaining{0};
};

} // namespace

PlacementEngine::PlacementEngine(EngineOptions options) : options_(options) {
  if (!std::isfinite(options_.epsilon) || options_.epsilon < 0.0) {
    throw loadplan::util::InvalidArgument("placement engine: epsilon must be a non-negative finite number");
  }
}

bool PlacementEngine::PacksBefore(const NormalizedRequest& a, const NormalizedRequest& b) {
  const double a_volume = a.box.Volume();
  const double b_volume = b.box.Volume();
  if (a_volume != b_volume) return a_volume > b_volume;
  if (a.unit_weight != b.unit_weight) return a.unit_weight > b.unit_weight;
  if (a.box.height != b.box.height) return a.box.height < b.box.height;
  return a.canonical < b.canonical;
}

bool PlacementEngine::FitsWithin(const Box& item, double width, double length, double height) const {
  return item.width <= width + options_.epsilon && item.length <= length + options_.epsilon && item.height <= height + options_.epsilon;
}

bool PlacementEngine::FitsWithinAnyTurn(const Box& item, double width, double length, double height) const {
  if (FitsWithin(item, width, length, height)) {
    return true;
  }
  return options_.allow_footprint_rotation && FitsWithin(item.TurnedFootprint(), width, length, height);
}

std::int64_t PlacementEngine::FloorCount(double available, double extent) const {
  if (extent <= 0.0 || available + options_.epsilon < extent) {
    return 0;
  }
  return static_cast<std::int64_t>(std::floor((available + options_.epsilon) / extent));
}

std::optional<Oversize> PlacementEngine::FindOversize(const std::vector<NormalizedRequest>& requests, const NormalizedContainer& container,
                                                      const NormalizedPallet& pallet) const {
  const Box&   hold          = container.box;
  const Box&   deck          = pallet.box;
  const double usable_height = hold.height - deck.height;

  // Pallets may always be turned on the container floor.
  const bool deck_fits = FitsWithin(deck, hold.width, hold.length, hold.height) ||
                         FitsWithin(deck.TurnedFootprint(), hold.width, hold.length, hold.height);
  if (!deck_fits || usable_height <= options_.epsilon) {
    return Oversize{Oversize::Kind::kPalletForContainer, nullptr};
  }

  for (const auto& request : requests) {
    if (request.quantity <= 0) {
      continue;
    }
    if (!FitsWithinAnyTurn(request.box, hold.width, hold.length, hold.height)) {
      return Oversize{Oversize::Kind::kProductForContainer, &request};
    }
    if (!FitsWithinAnyTurn(request.box, deck.width, deck.length, usable_height)) {
      return Oversize{Oversize::Kind::kProductForPallet, &request};
    }
  }
  return std::nullopt;
}

std::size_t PlacementEngine::SlotCount(const NormalizedContainer& container, const NormalizedPallet& pallet) const {
  const Box& hold = container.box;
  const Box& deck = pallet.box;

  if (options_.layout == PalletLayout::kStacked) {
    return static_cast<std::size_t>(FloorCount(hold.height, deck.height));
  }

  const auto as_given = FloorCount(hold.width, deck.width) * FloorCount(hold.length, deck.length);
  const auto turned   = FloorCount(hold.width, deck.length) * FloorCount(hold.length, deck.width);
  return static_cast<std::size_t>(std::max(as_given, turned));
}

PalletSlot PlacementEngine::SlotAt(std::size_t index, const NormalizedContainer& container, const NormalizedPallet& pallet,
                                   double stack_base) const {
  const Box& hold = container.box;
  const Box& deck = pallet.box;

  PalletSlot slot;
  slot.index = index;

  if (options_.layout == PalletLayout::kStacked) {
    slot.turned        = !FitsWithin(deck, hold.width, hold.length, hold.height);
    slot.origin.z      = stack_base;
    slot.usable_height = hold.height - stack_base - deck.height;
    return slot;
  }

  const auto as_given = FloorCount(hold.width, deck.width) * FloorCount(hold.length, deck.length);
  const auto turned   = FloorCount(hold.width, deck.length) * FloorCount(hold.length, deck.width);
  slot.turned         = turned > as_given;

  const Box  footprint = slot.turned ? deck.TurnedFootprint() : deck;
  const auto columns   = std::max<std::int64_t>(1, FloorCount(hold.width, footprint.width));
  const auto i         = static_cast<std::int64_t>(index);
  slot.origin.x        = static_cast<double>(i % columns) * footprint.width;
  slot.origin.y        = static_cast<double>(i / columns) * footprint.length;
  slot.usable_height   = hold.height - deck.height;
  return slot;
}

PlacementPlan PlacementEngine::Pack(const std::vector<NormalizedRequest>& requests, const NormalizedContainer& container,
                                    const NormalizedPallet& pallet) const {
  PlacementPlan plan;
  plan.usable_height = container.box.height - pallet.box.height;

  plan.oversize = FindOversize(requests, container, pallet);
  if (plan.oversize) {
    return plan;
  }

  std::vector<Pending> pending;
  pending.reserve(requests.size());
  for (const auto& request : requests) {
    if (request.quantity > 0) {
      pending.push_back(Pending{&request, request.quantity});
    }
  }
  std::sort(pending.begin(), pending.end(), [](const Pending& a, const Pending& b) { return PacksBefore(*a.request, *b.request); });

  const auto slot_count       = SlotCount(container, pallet);
  double     committed_weight = 0.0;
  double     stack_base       = 0.0;
  auto       outstanding      = [&pending] {
    return std::any_of(pending.begin(), pending.end(), [](const Pending& p) { return p.remaining > 0; });
  };

  for (std::size_t slot = 0; slot < slot_count && outstanding(); ++slot) {
    // The tare alone must fit under the container limit.
    if (container.max_weight && committed_weight + pallet.tare_weight > *container.max_weight + kWeightTolerance) {
      break;
    }

    PackedPallet packed;
    packed.slot = SlotAt(slot, container, pallet, stack_base);
    if (packed.slot.usable_height <= options_.epsilon) {
      break;
    }
    ShelfCursor cursor(pallet.box, packed.slot.usable_height, options_.epsilon);

    for (auto& item : pending) {
      const auto& request = *item.request;

      while (item.remaining > 0) {
        std::int64_t allowance = item.remaining;
        if (pallet.max_weight) {
          allowance = std::min(allowance, UnitsWithin(*pallet.max_weight, packed.goods_weight, request.unit_weight));
        }
        if (container.max_weight) {
          const double load = committed_weight + pallet.tare_weight + packed.goods_weight;
          allowance         = std::min(allowance, UnitsWithin(*container.max_weight, load, request.unit_weight));
        }
        if (allowance <= 0) {
          break;
        }

        bool turned = false;
        auto run    = cursor.Reserve(request.box, allowance);
        if (!run && options_.allow_footprint_rotation) {
          run    = cursor.Reserve(request.box.TurnedFootprint(), allowance);
          turned = run.has_value();
        }
        if (!run) {
          break;
        }

        packed.runs.push_back(PlacedRun{&request, run->count, run->position, turned});
        packed.goods_weight += static_cast<double>(run->count) * request.unit_weight;
        packed.goods_volume += static_cast<double>(run->count) * request.box.Volume();
        item.remaining -= run->count;
      }
    }

    // An empty pallet that takes nothing means every later slot would too.
    if (packed.runs.empty()) {
      break;
    }

    packed.load_height = cursor.load_height();
    if (options_.layout == PalletLayout::kStacked) {
      stack_base = packed.slot.origin.z + pallet.box.height + packed.load_height;
    }
    committed_weight += pallet.tare_weight + packed.goods_weight;
    plan.pallets.push_back(std::move(packed));
  }

  for (const auto& item : pending) {
    if (item.remaining > 0) {
      plan.remaining.push_back(Remainder{item.request, item.remaining});
    }
  }
  return plan;
}

} // namespace loadplan::core
