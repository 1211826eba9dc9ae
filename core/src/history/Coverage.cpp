#include "mtc/history/Coverage.hpp"

#include <algorithm>

namespace mtc {

Coverage computeCoverage(const CandleSeries& bars, std::int64_t resolutionMs) {
  Coverage cov;
  if (bars.empty() || resolutionMs <= 0) return cov;

  cov.firstTs = bars.front().t;
  cov.lastTs = bars.back().t;
  cov.expectedBars = (cov.lastTs - cov.firstTs) / resolutionMs + 1;

  std::int64_t unique = 1;
  for (std::size_t i = 1; i < bars.size(); i++) {
    std::int64_t delta = bars[i].t - bars[i - 1].t;
    if (delta <= 0) continue;
    unique++;
    if (delta > resolutionMs) {
      cov.gapCount++;
      cov.maxGapMs = std::max(cov.maxGapMs, delta - resolutionMs);
    }
  }

  cov.missingBars = std::max<std::int64_t>(0, cov.expectedBars - unique);
  cov.coveragePct = cov.expectedBars > 0
      ? std::min(1.0, static_cast<double>(unique) / static_cast<double>(cov.expectedBars))
      : 0.0;
  return cov;
}

} // namespace mtc
