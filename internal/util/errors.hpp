#pragma once

#include <stdexcept>
#include <string>

namespace loadplan::util {

/*
  Central error types.

  These get translated later to gRPC status codes. User-facing packing
  failures are not errors; they travel inside OptimizationResult.
*/

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace loadplan::util
