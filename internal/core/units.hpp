#pragma once

#include <string>

#include "internal/core/model.hpp"
#include "loadplan/core/v1/types.pb.h"

namespace loadplan::core {

inline constexpr double kCentimetersPerInch      = 2.54;
inline constexpr double kCentimetersPerMillimeter = 0.1;

bool IsKnownUnit(loadplan::core::v1::LengthUnit unit);

// Values tagged with an unknown unit pass through unchanged; rejecting them
// is the validator's job.
double ToCentimeters(double value, loadplan::core::v1::LengthUnit unit);

Box NormalizeDimensions(const loadplan::core::v1::Dimensions& dimensions);

NormalizedRequest   NormalizeRequest(const loadplan::core::v1::ProductRequest& request);
NormalizedContainer NormalizeContainer(const loadplan::core::v1::Container& container);
NormalizedPallet    NormalizePallet(const loadplan::core::v1::PalletTemplate& pallet);

// Deterministic serialization; identical messages give identical bytes.
std::string CanonicalBytes(const google::protobuf::Message& message);

} // namespace loadplan::core
