#include "mtc/math/Indicators.hpp"
#include <algorithm>
#include <cmath>

namespace mtc {

std::vector<IndicatorPoint> computeSma(const CandleSeries& bars, int period) {
  std::vector<IndicatorPoint> points;
  int count = static_cast<int>(bars.size());
  if (period < 1 || count < period) return points;

  points.reserve(static_cast<std::size_t>(count - period + 1));
  double sum = 0.0;
  for (int i = 0; i < count; i++) {
    sum += bars[static_cast<std::size_t>(i)].c;
    if (i >= period) sum -= bars[static_cast<std::size_t>(i - period)].c;
    if (i >= period - 1) {
      points.push_back({i, sum / static_cast<double>(period)});
    }
  }
  return points;
}

bool computeAtr(const CandleSeries& bars, int period, double& out) {
  int count = static_cast<int>(bars.size());
  if (period < 1 || count < period + 1) return false;

  double total = 0.0;
  for (int i = count - period; i < count; i++) {
    const Candle& cur = bars[static_cast<std::size_t>(i)];
    const Candle& prev = bars[static_cast<std::size_t>(i - 1)];
    double highLow = cur.h - cur.l;
    double highClose = std::fabs(cur.h - prev.c);
    double lowClose = std::fabs(cur.l - prev.c);
    total += std::max(highLow, std::max(highClose, lowClose));
  }
  out = total / static_cast<double>(period);
  return true;
}

bool computeRsi(const CandleSeries& bars, int period, double& out) {
  int count = static_cast<int>(bars.size());
  if (period < 1 || count < period + 1) return false;

  double gains = 0.0, losses = 0.0;
  for (int i = count - period; i < count; i++) {
    double change = bars[static_cast<std::size_t>(i)].c - bars[static_cast<std::size_t>(i - 1)].c;
    if (change >= 0) gains += change;
    else losses -= change;
  }

  if (gains == 0.0 && losses == 0.0) {
    out = 50.0;
  } else if (losses == 0.0) {
    out = 100.0;
  } else {
    double rs = gains / losses;
    out = 100.0 - 100.0 / (1.0 + rs);
  }
  return true;
}

} // namespace mtc
