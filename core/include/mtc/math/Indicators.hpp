#pragma once
#include "mtc/data/Candle.hpp"

#include <vector>

namespace mtc {

// Indicators are recomputed from the full series on every draw; nothing here
// keeps streaming state.

struct IndicatorPoint {
  int index;      // index into the input series
  double value;
};

// Simple moving average of closes. One point per index >= period-1.
std::vector<IndicatorPoint> computeSma(const CandleSeries& bars, int period);

// Mean true range over the last `period` bars. Needs bars.size() >= period+1.
// Returns false when there is not enough data.
bool computeAtr(const CandleSeries& bars, int period, double& out);

// RSI from simple gains/losses over the last `period` changes.
// 50 when flat, 100 when there were no losses.
bool computeRsi(const CandleSeries& bars, int period, double& out);

} // namespace mtc
