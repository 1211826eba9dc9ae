#include "mtc/live/Quote.hpp"

#include <cmath>

namespace mtc {

static bool usable(bool has, double v) {
  return has && std::isfinite(v);
}

bool resolveQuotePrice(const LiveQuote& q, double& price) {
  if (usable(q.hasMid, q.mid)) { price = q.mid; return true; }
  if (usable(q.hasLast, q.last)) { price = q.last; return true; }
  bool bid = usable(q.hasBid, q.bid);
  bool ask = usable(q.hasAsk, q.ask);
  if (bid && ask) { price = (q.bid + q.ask) / 2.0; return true; }
  if (bid) { price = q.bid; return true; }
  if (ask) { price = q.ask; return true; }
  return false;
}

std::int64_t normalizeQuoteTs(std::int64_t raw) {
  if (raw <= 0) return 0;
  return raw > 100000000000LL ? raw : raw * 1000;
}

} // namespace mtc
