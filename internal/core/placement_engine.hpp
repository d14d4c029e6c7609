#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "internal/core/model.hpp"

namespace loadplan::core {

enum class PalletLayout {
  // Pallets on one footprint position, each deck resting on the load below.
  kStacked,
  // One tier of pallets tiled over the container floor.
  kFloorGrid,
};

struct EngineOptions {
  PalletLayout layout{PalletLayout::kStacked};
  bool         allow_footprint_rotation{false};
  double       epsilon{1e-6};
};

// x runs along the width, y along the length, z up. Centimeters.
struct Vec3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};
};

struct PlacedRun {
  const NormalizedRequest* request{nullptr};
  std::int64_t             quantity{0};
  Vec3                     position;
  bool                     turned{false};
};

struct PalletSlot {
  std::size_t index{0};
  Vec3        origin;
  bool        turned{false};
  // Room above the deck, up to the container ceiling.
  double      usable_height{0.0};
};

struct PackedPallet {
  PalletSlot             slot;
  std::vector<PlacedRun> runs;
  double                 goods_weight{0.0};
  double                 goods_volume{0.0};
  // Top of the highest unit above the deck.
  double                 load_height{0.0};
};

struct Remainder {
  const NormalizedRequest* request{nullptr};
  std::int64_t             quantity{0};
};

struct Oversize {
  enum class Kind {
    kPalletForContainer,
    kProductForContainer,
    kProductForPallet,
  };

  Kind                     kind{Kind::kPalletForContainer};
  const NormalizedRequest* request{nullptr};
};

struct PlacementPlan {
  std::vector<PackedPallet> pallets;
  std::vector<Remainder>    remaining;
  // Room above the first deck; later stacked decks get less.
  double                    usable_height{0.0};
  std::optional<Oversize>   oversize;
};

/*
  Shelf-packing heuristic.

  Requests are taken largest unit volume first. Each pallet is filled row by
  row and layer by layer; whatever does not fit spills to the next pallet
  slot, and whatever is left after the last slot is returned as remainder.
  Placed plus remaining quantity always equals the requested quantity.
*/
class PlacementEngine {
 public:
  explicit PlacementEngine(EngineOptions options = {});

  // requests must be validated and outlive the returned plan.
  PlacementPlan Pack(const std::vector<NormalizedRequest>& requests, const NormalizedContainer& container,
                     const NormalizedPallet& pallet) const;

  // Upper bound on pallet slots. Stacked slots past the first are only
  // reachable while the loads below leave room.
  std::size_t SlotCount(const NormalizedContainer& container, const NormalizedPallet& pallet) const;

  // stack_base is where the deck rests in STACKED layout; FLOOR_GRID ignores it.
  PalletSlot SlotAt(std::size_t index, const NormalizedContainer& container, const NormalizedPallet& pallet,
                    double stack_base = 0.0) const;

  // Strict weak order used for packing; independent of the caller's ordering.
  static bool PacksBefore(const NormalizedRequest& a, const NormalizedRequest& b);

  const EngineOptions& options() const {
    return options_;
  }

 private:
  std::optional<Oversize> FindOversize(const std::vector<NormalizedRequest>& requests, const NormalizedContainer& container,
                                       const NormalizedPallet& pallet) const;

  bool FitsWithin(const Box& item, double width, double length, double height) const;
  bool FitsWithinAnyTurn(const Box& item, double width, double length, double height) const;

  std::int64_t FloorCount(double available, double extent) const;

  EngineOptions options_;
};

} // namespace loadplan::core
