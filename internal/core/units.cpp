#include "units.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "internal/util/errors.hpp"

namespace loadplan::core {

using namespace loadplan::core::v1;

bool IsKnownUnit(LengthUnit unit) {
  switch (unit) {
    case LENGTH_UNIT_CENTIMETERS:
    case LENGTH_UNIT_MILLIMETERS:
    case LENGTH_UNIT_INCHES:
      return true;
    default:
      return false;
  }
}

double ToCentimeters(double value, LengthUnit unit) {
  switch (unit) {
    case LENGTH_UNIT_INCHES:
      return value * kCentimetersPerInch;
    case LENGTH_UNIT_MILLIMETERS:
      return value * kCentimetersPerMillimeter;
    default:
      return value;
  }
}

Box NormalizeDimensions(const Dimensions& dimensions) {
  return Box{ToCentimeters(dimensions.length(), dimensions.unit()), ToCentimeters(dimensions.width(), dimensions.unit()),
             ToCentimeters(dimensions.height(), dimensions.unit())};
}

NormalizedRequest NormalizeRequest(const ProductRequest& request) {
  NormalizedRequest normalized;
  normalized.source      = &request;
  normalized.box         = NormalizeDimensions(request.product().dimensions());
  normalized.unit_weight = request.product().weight();
  normalized.quantity    = request.quantity();
  normalized.canonical   = CanonicalBytes(request);
  return normalized;
}

NormalizedContainer NormalizeContainer(const Container& container) {
  NormalizedContainer normalized;
  normalized.box = NormalizeDimensions(container.dimensions());
  if (container.has_max_weight()) {
    normalized.max_weight = container.max_weight();
  }
  return normalized;
}

NormalizedPallet NormalizePallet(const PalletTemplate& pallet) {
  NormalizedPallet normalized;
  normalized.box         = NormalizeDimensions(pallet.dimensions());
  normalized.tare_weight = pallet.tare_weight();
  if (pallet.has_max_weight()) {
    normalized.max_weight = pallet.max_weight();
  }
  return normalized;
}

std::string CanonicalBytes(const google::protobuf::Message& message) {
  std::string bytes;
  {
    google::protobuf::io::StringOutputStream stream(&bytes);
    google::protobuf::io::CodedOutputStream  coded(&stream);
    coded.SetSerializationDeterministic(true);
    if (!message.SerializeToCodedStream(&coded)) {
      throw loadplan::util::InvalidState("canonical encoding failed for " + message.GetTypeName());
    }
  }
  return bytes;
}

} // namespace loadplan::core
