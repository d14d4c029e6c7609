#include "time.hpp"

namespace loadplan::util {

TimePoint Now() {
  return Clock::now();
}

double ElapsedMillis(TimePoint since) {
  return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

} // namespace loadplan::util
