#pragma once
#include "mtc/frames/FrameConfig.hpp"
#include "mtc/frames/FrameState.hpp"
#include "mtc/geometry/PlotGeometry.hpp"
#include "mtc/overlay/LevelCompositor.hpp"
#include "mtc/render/DrawList.hpp"
#include "mtc/render/LabelPlacer.hpp"
#include "mtc/style/Theme.hpp"
#include "mtc/text/TextLayout.hpp"

#include <cstdint>
#include <string>

namespace mtc {

struct FrameRenderConfig {
  PlotPadding padding;
  LabelPlacerConfig tags;
  std::int64_t liveMarkerFreshMs{5000};
  int smaFastPeriod{20};
  int smaSlowPeriod{50};
  int atrPeriod{14};
  int rsiPeriod{14};
  float axisFontPx{10};
  float messageFontPx{12};
};

// Everything one draw of one frame depends on.
struct FrameRenderInput {
  const FrameConfig* frame{nullptr};
  const FrameState* state{nullptr};
  const LevelCompositor* compositor{nullptr};
  int width{0};
  int height{0};

  bool hasBid{false}, hasAsk{false}, hasQuotePrice{false};
  double bid{0}, ask{0}, quotePrice{0};
  std::int64_t quoteTsMs{0};

  int sessionOpen{-1};            // 0 tints the plot
  bool connected{true};
  std::string brokerLabel{"broker"};
  std::int64_t nowMs{0};
  const OverlayLevel* dragPreview{nullptr};
};

struct FrameRenderResult {
  bool hasPlot{false};            // false for the empty state
  PlotMeta meta;
  LevelList levels;               // what was drawn, selection order
};

// Turns one frame's state into a DrawList, painter order back to front:
// background, session tint and blocks, grid, day guides, bid/ask band,
// ATR band, candles, live marker, SMAs, indicator line, levels, axes.
class FrameRenderer {
public:
  FrameRenderer();

  void setConfig(const FrameRenderConfig& cfg) { config_ = cfg; }
  const FrameRenderConfig& config() const { return config_; }

  void setTheme(const ChartTheme& theme) { theme_ = theme; }
  const ChartTheme& theme() const { return theme_; }

  void setTextMeasure(TextMeasureFn fn);

  FrameRenderResult render(const FrameRenderInput& in, DrawList& out) const;

private:
  void drawEmptyState(const FrameRenderInput& in, DrawList& out) const;
  void drawIndicators(const CandleSeries& bars, const CandleSeries& visible,
                      const PlotMeta& meta, DrawList& out) const;
  void drawLevels(const LevelList& levels, const PlotMeta& meta, DrawList& out) const;
  void drawAxes(const FrameConfig& frame, const CandleSeries& visible,
                const PlotMeta& meta, DrawList& out) const;

  FrameRenderConfig config_;
  ChartTheme theme_;
  TextMeasureFn measure_;
};

// "5m 5m | Bars: 240 | Updated: 12s | cov 93% | gaps 3 | Ready"
std::string formatFrameHeader(const FrameConfig& frame, const FrameState* state,
                              std::int64_t nowMs);

} // namespace mtc
