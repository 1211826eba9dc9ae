#pragma once
#include <cstdint>
#include <vector>

namespace mtc {

// One OHLC bar. t is the bucket start in epoch milliseconds.
struct Candle {
  std::int64_t t{0};
  double o{0}, h{0}, l{0}, c{0};
  double v{0};
  bool hasVolume{false};
};

using CandleSeries = std::vector<Candle>;

} // namespace mtc
