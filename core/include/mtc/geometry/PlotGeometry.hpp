#pragma once
#include "mtc/data/Candle.hpp"
#include "mtc/overlay/OverlayLevel.hpp"

#include <string>
#include <unordered_map>

namespace mtc {

struct PlotRect {
  double x{0}, y{0}, w{0}, h{0};

  bool contains(double px, double py) const {
    return px >= x && px <= x + w && py >= y && py <= y + h;
  }
};

struct PlotPadding {
  double top{18};
  double right{64};
  double bottom{22};
  double left{44};
};

// Plot area inside a surface of the given pixel size. Never smaller than 1x1.
PlotRect computePlotRect(int width, int height, const PlotPadding& pad = PlotPadding{});

// The price<->pixel transform of one frame at one render (y grows down).
struct PlotMeta {
  std::string frameId;
  std::string resolution;
  PlotRect plot;
  double paddedMin{0};
  double paddedMax{1};
  double priceRange{1};
  int barCount{0};

  double priceToY(double price) const {
    return plot.y + (paddedMax - price) / priceRange * plot.h;
  }

  // Clamps y into the plot first. Returns false on a zero-area plot.
  bool yToPrice(double y, double& price) const;

  double barWidth() const { return barCount > 0 ? plot.w / barCount : plot.w; }
  double barCenterX(int index) const { return plot.x + (index + 0.5) * barWidth(); }
  double bodyWidth() const;
};

// Price range from bar highs/lows plus level prices, padded by 8% of the
// range (or 1% of |max|, at least 1, when the range is zero).
PlotMeta computePlotMeta(const std::string& frameId, const std::string& resolution,
                         const PlotRect& plot, const CandleSeries& visible,
                         const LevelList& levels);

// Last PlotMeta rendered per frame, plus one fullscreen slot. Interaction
// reads exactly what was drawn.
class PlotMetaCache {
public:
  void store(const PlotMeta& meta) { frames_[meta.frameId] = meta; }
  void storeFullscreen(const PlotMeta& meta) { fullscreen_ = meta; hasFullscreen_ = true; }

  const PlotMeta* find(const std::string& frameId) const;
  const PlotMeta* fullscreen() const { return hasFullscreen_ ? &fullscreen_ : nullptr; }

  void erase(const std::string& frameId) { frames_.erase(frameId); }
  void clearFullscreen() { hasFullscreen_ = false; }
  void clear() { frames_.clear(); hasFullscreen_ = false; }

private:
  std::unordered_map<std::string, PlotMeta> frames_;
  PlotMeta fullscreen_;
  bool hasFullscreen_{false};
};

} // namespace mtc
