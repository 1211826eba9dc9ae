#include "mtc/live/QuoteThrottle.hpp"

#include <cstdlib>

namespace mtc {

bool QuoteThrottle::accept(double price, std::int64_t ts) {
  if (hasLast_) {
    if (price == last_.price && std::llabs(ts - last_.ts) < config_.repeatWindowMs) return false;
    if (ts - last_.ts < config_.minIntervalMs) return false;
  }
  last_ = {price, ts};
  hasLast_ = true;
  return true;
}

} // namespace mtc
