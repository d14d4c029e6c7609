#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "loadplan/core/v1/types.pb.h"

namespace loadplan::core {

/*
  Canonical-unit (centimeters, kilograms) views of the caller's messages.

  The views borrow the caller's messages; they are valid for the duration
  of one optimization call and are never written through.
*/

struct Box {
  double length{0.0};
  double width{0.0};
  double height{0.0};

  double Volume() const {
    return length * width * height;
  }

  double FootprintArea() const {
    return length * width;
  }

  // Quarter turn about the vertical axis.
  Box TurnedFootprint() const {
    return Box{width, length, height};
  }
};

struct NormalizedRequest {
  const loadplan::core::v1::ProductRequest* source{nullptr};
  Box                                       box;
  double                                    unit_weight{0.0};
  std::int64_t                              quantity{0};
  // Deterministic byte encoding of the request, used for ordering and keys.
  std::string                               canonical;

  const loadplan::core::v1::Product& product() const {
    return source->product();
  }
};

struct NormalizedContainer {
  Box                   box;
  std::optional<double> max_weight;
};

struct NormalizedPallet {
  Box                   box;
  double                tare_weight{0.0};
  std::optional<double> max_weight;
};

using ProductRequests = std::vector<loadplan::core::v1::ProductRequest>;

} // namespace loadplan::core
