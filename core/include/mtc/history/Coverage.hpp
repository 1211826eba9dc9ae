#pragma once
#include "mtc/data/Candle.hpp"

#include <cstdint>

namespace mtc {

// Diagnostic only; never used to mutate bars.
struct Coverage {
  std::int64_t expectedBars{0};
  std::int64_t missingBars{0};
  std::int64_t gapCount{0};
  std::int64_t maxGapMs{0};     // largest hole, excluding the regular bucket step
  double coveragePct{0};        // 0..1
  std::int64_t firstTs{0};
  std::int64_t lastTs{0};
};

// Contiguous-bucket analysis of a sorted series.
Coverage computeCoverage(const CandleSeries& bars, std::int64_t resolutionMs);

} // namespace mtc
