#include "mtc/geometry/PlotGeometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace mtc {

PlotRect computePlotRect(int width, int height, const PlotPadding& pad) {
  PlotRect r;
  r.x = pad.left;
  r.y = pad.top;
  r.w = std::max(1.0, width - pad.left - pad.right);
  r.h = std::max(1.0, height - pad.top - pad.bottom);
  return r;
}

bool PlotMeta::yToPrice(double y, double& price) const {
  if (plot.h <= 0 || priceRange <= 0) return false;
  double cy = std::max(plot.y, std::min(plot.y + plot.h, y));
  price = paddedMax - (cy - plot.y) / plot.h * priceRange;
  return std::isfinite(price);
}

double PlotMeta::bodyWidth() const {
  return std::max(1.0, barWidth() * 0.65);
}

PlotMeta computePlotMeta(const std::string& frameId, const std::string& resolution,
                         const PlotRect& plot, const CandleSeries& visible,
                         const LevelList& levels) {
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  for (const auto& b : visible) {
    if (std::isfinite(b.l)) lo = std::min(lo, b.l);
    if (std::isfinite(b.h)) hi = std::max(hi, b.h);
  }
  for (const auto& lv : levels) {
    if (!std::isfinite(lv.price)) continue;
    lo = std::min(lo, lv.price);
    hi = std::max(hi, lv.price);
  }
  if (!std::isfinite(lo) || !std::isfinite(hi)) {
    lo = 0;
    hi = 0;
  }

  double range = hi - lo;
  double pad = range > 0 ? range * 0.08 : std::max(1.0, std::fabs(hi) * 0.01);

  PlotMeta m;
  m.frameId = frameId;
  m.resolution = resolution;
  m.plot = plot;
  m.paddedMin = lo - pad;
  m.paddedMax = hi + pad;
  m.priceRange = m.paddedMax - m.paddedMin;
  if (m.priceRange == 0) m.priceRange = 1;
  m.barCount = static_cast<int>(visible.size());
  return m;
}

const PlotMeta* PlotMetaCache::find(const std::string& frameId) const {
  auto it = frames_.find(frameId);
  return it == frames_.end() ? nullptr : &it->second;
}

} // namespace mtc
