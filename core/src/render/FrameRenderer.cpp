#include "mtc/render/FrameRenderer.hpp"
#include "mtc/math/Indicators.hpp"
#include "mtc/math/PriceFormat.hpp"
#include "mtc/math/TimeFormat.hpp"
#include "mtc/overlay/Sessions.hpp"

#include <algorithm>
#include <cmath>

namespace mtc {

FrameRenderer::FrameRenderer()
  : theme_(darkChartTheme()), measure_(makeTextMeasure(nullptr)) {}

void FrameRenderer::setTextMeasure(TextMeasureFn fn) {
  measure_ = fn ? std::move(fn) : makeTextMeasure(nullptr);
}

void FrameRenderer::drawEmptyState(const FrameRenderInput& in, DrawList& out) const {
  float px = config_.messageFontPx;
  bool loading = in.state && in.state->loading;
  out.addText(loading ? "Loading broker history..." : "No history yet.", 14, 22, px, theme_.textDim);
  if (!in.connected) {
    out.addText("Connect " + in.brokerLabel + " to load history.", 14, 40, px, theme_.textDim);
  }
  if (in.state && !in.state->error.empty()) {
    out.addText(in.state->error, 14, 58, px, theme_.textError);
  }
}

FrameRenderResult FrameRenderer::render(const FrameRenderInput& in, DrawList& out) const {
  FrameRenderResult result;
  int width = std::max(1, in.width);
  int height = std::max(1, in.height);
  out.reset(width, height);
  out.setClearColor(theme_.bg);
  out.addRect(0, 0, static_cast<float>(width), static_cast<float>(height), theme_.bg);

  if (!in.frame || !in.compositor) return result;
  const CandleSeries empty;
  const CandleSeries& bars = in.state ? in.state->bars : empty;
  if (bars.size() < 2) {
    drawEmptyState(in, out);
    return result;
  }

  const FrameConfig& frame = *in.frame;
  const LevelCompositor& comp = *in.compositor;
  const OverlayToggles& toggles = comp.toggles();

  std::size_t display = frame.displayBars > 0 ? static_cast<std::size_t>(frame.displayBars) : bars.size();
  std::size_t first = bars.size() > display ? bars.size() - display : 0;
  CandleSeries visible(bars.begin() + static_cast<std::ptrdiff_t>(first), bars.end());

  std::vector<SessionBlock> blocks;
  if (toggles.sessions) blocks = buildSessionBlocks(visible);

  LevelList priced = comp.pricedLevels(frame, visible);
  PlotRect plot = computePlotRect(width, height, config_.padding);
  PlotMeta meta = computePlotMeta(frame.id, frame.resolution, plot, visible, priced);
  result.hasPlot = true;

  const float px = static_cast<float>(plot.x);
  const float py = static_cast<float>(plot.y);
  const float pw = static_cast<float>(plot.w);
  const float ph = static_cast<float>(plot.h);
  const double barW = meta.barWidth();

  if (toggles.sessions && in.sessionOpen == 0) {
    out.addRect(px, py, pw, ph, theme_.sessionClosed);
    out.addText("SESSION CLOSED", px + 8, py + 14, 11, theme_.sessionClosedText);
  }

  for (const auto& block : blocks) {
    if (!block.style) continue;
    float x = static_cast<float>(plot.x + block.startIndex * barW);
    float w = static_cast<float>(std::max(1.0, (block.endIndex - block.startIndex + 1) * barW));
    out.addRect(x, py, w, ph, block.style->fill);
    if (w > 30) out.addText(block.style->label, x + 4, py + 12, 10, theme_.textDim);
  }

  for (int i = 0; i <= 4; i++) {
    float y = py + ph / 4 * static_cast<float>(i);
    out.addLine(px, y, px + pw, y, theme_.grid);
  }
  for (int i = 0; i <= 6; i++) {
    float x = px + pw / 6 * static_cast<float>(i);
    out.addLine(x, py, x, py + ph, theme_.grid);
  }

  if (toggles.sessions) {
    std::int64_t lastDay = utcDayIndex(visible.front().t);
    for (std::size_t i = 1; i < visible.size(); i++) {
      std::int64_t day = utcDayIndex(visible[i].t);
      if (day == lastDay) continue;
      float x = static_cast<float>(plot.x + static_cast<double>(i) * barW);
      out.addDashedLine(x, py, x, py + ph, theme_.gridStrong);
      lastDay = day;
    }
  }

  if (toggles.liveQuote && in.hasBid && in.hasAsk && in.ask >= in.bid) {
    double yBid = meta.priceToY(in.bid);
    double yAsk = meta.priceToY(in.ask);
    double top = std::min(yBid, yAsk);
    double bandH = std::max(1.0, std::fabs(yAsk - yBid));
    out.addRect(px, static_cast<float>(top), pw, static_cast<float>(bandH), theme_.quoteBand);
  }

  if (toggles.indicators) {
    double atr = 0;
    double lastClose = visible.back().c;
    if (computeAtr(visible, config_.atrPeriod, atr) && std::isfinite(lastClose)) {
      double yTop = meta.priceToY(lastClose + atr);
      double yBot = meta.priceToY(lastClose - atr);
      out.addRect(px, static_cast<float>(std::min(yTop, yBot)), pw,
                  static_cast<float>(std::fabs(yBot - yTop)), theme_.atrBand);
    }
  }

  float halfBody = static_cast<float>(meta.bodyWidth() / 2);
  for (std::size_t i = 0; i < visible.size(); i++) {
    const Candle& b = visible[i];
    out.addCandle(static_cast<float>(meta.barCenterX(static_cast<int>(i))),
                  static_cast<float>(meta.priceToY(b.o)),
                  static_cast<float>(meta.priceToY(b.h)),
                  static_cast<float>(meta.priceToY(b.l)),
                  static_cast<float>(meta.priceToY(b.c)),
                  halfBody, theme_.up, theme_.down, theme_.wick);
  }

  if (toggles.liveQuote && in.hasQuotePrice && std::isfinite(in.quotePrice)) {
    float x = static_cast<float>(meta.barCenterX(static_cast<int>(visible.size()) - 1));
    float y = static_cast<float>(meta.priceToY(in.quotePrice));
    bool fresh = in.quoteTsMs > 0 &&
                 std::max<std::int64_t>(0, in.nowMs - in.quoteTsMs) <= config_.liveMarkerFreshMs;
    out.addCircle(x, y, fresh ? 3.5f : 2.5f, fresh ? theme_.last : theme_.textDim);
  }

  if (toggles.indicators) drawIndicators(bars, visible, meta, out);

  const OverlayLevel* preview = in.dragPreview;
  if (preview && preview->kind != LevelKind::Drag) preview = nullptr;
  result.levels = comp.finalize(priced, visible, blocks, preview, meta.priceRange);
  drawLevels(result.levels, meta, out);

  drawAxes(frame, visible, meta, out);

  result.meta = meta;
  return result;
}

void FrameRenderer::drawIndicators(const CandleSeries& bars, const CandleSeries& visible,
                                   const PlotMeta& meta, DrawList& out) const {
  // SMAs run on the full series so the first visible points are warm.
  std::vector<IndicatorPoint> fast = computeSma(bars, config_.smaFastPeriod);
  std::vector<IndicatorPoint> slow = computeSma(bars, config_.smaSlowPeriod);
  int startIndex = static_cast<int>(bars.size() - visible.size());

  auto drawSeries = [&](const std::vector<IndicatorPoint>& points, const Color& color) {
    std::vector<float> xs, ys;
    for (const auto& p : points) {
      if (p.index < startIndex) continue;
      xs.push_back(static_cast<float>(meta.barCenterX(p.index - startIndex)));
      ys.push_back(static_cast<float>(meta.priceToY(p.value)));
    }
    if (xs.size() < 2) return;
    out.addPolyline(xs, ys, color, 1.2f);
  };
  drawSeries(fast, theme_.smaFast);
  drawSeries(slow, theme_.smaSlow);

  std::string line;
  auto part = [&](const std::string& s) {
    if (!line.empty()) line += " | ";
    line += s;
  };
  if (!fast.empty()) part("SMA" + std::to_string(config_.smaFastPeriod) + " " + formatPrice(fast.back().value));
  if (!slow.empty()) part("SMA" + std::to_string(config_.smaSlowPeriod) + " " + formatPrice(slow.back().value));

  double atr = 0;
  double rsi = 0;
  bool hasAtr = computeAtr(visible, config_.atrPeriod, atr);
  double lastClose = visible.back().c;
  if (hasAtr) {
    part("ATR" + std::to_string(config_.atrPeriod) + " " + formatPrice(atr));
    if (std::isfinite(lastClose) && lastClose != 0) {
      double pct = atr / lastClose * 100;
      if (std::isfinite(pct)) part("Vol " + formatFixed(pct, 2) + "%");
    }
  }
  if (computeRsi(visible, config_.rsiPeriod, rsi)) {
    part("RSI" + std::to_string(config_.rsiPeriod) + " " + formatFixed(rsi, 1));
  }
  if (line.empty()) return;

  float infoY = static_cast<float>(std::max(10.0, meta.plot.y - 6));
  out.addText(line, static_cast<float>(meta.plot.x), infoY, config_.axisFontPx, theme_.textDim);
}

void FrameRenderer::drawLevels(const LevelList& levels, const PlotMeta& meta,
                               DrawList& out) const {
  const PlotRect& plot = meta.plot;
  const float x0 = static_cast<float>(plot.x);
  const float x1 = static_cast<float>(plot.x + plot.w);
  const float fontPx = config_.axisFontPx;

  std::vector<double> desired;
  desired.reserve(levels.size());
  for (const auto& lv : levels) {
    float y = static_cast<float>(meta.priceToY(lv.price));
    if (lv.style == LevelStyle::Dashed) out.addDashedLine(x0, y, x1, y, lv.color);
    else out.addLine(x0, y, x1, y, lv.color);
    desired.push_back(y);
  }

  std::vector<double> tagY = placeLevelTags(desired, plot.y, plot.h, config_.tags);
  const float textX = x1 + 6;
  for (std::size_t i = 0; i < levels.size(); i++) {
    const OverlayLevel& lv = levels[i];
    std::string label = lv.label + " " + formatPrice(lv.price);
    float textW = measure_(label, fontPx);
    float y = static_cast<float>(tagY[i]);
    out.addRect(textX - 2, y - 8, textW + 4, 12, theme_.tagBox);
    out.addText(label, textX, y + 2, fontPx, lv.color);
  }
}

void FrameRenderer::drawAxes(const FrameConfig& frame, const CandleSeries& visible,
                             const PlotMeta& meta, DrawList& out) const {
  const PlotRect& plot = meta.plot;
  const float fontPx = config_.axisFontPx;

  for (int i = 0; i <= 4; i++) {
    double price = meta.paddedMax - meta.priceRange / 4 * i;
    double y = plot.y + plot.h / 4 * i;
    out.addText(formatPrice(price), static_cast<float>(plot.x + plot.w + 6),
                static_cast<float>(y + 3), fontPx, theme_.textDim);
  }

  const char* fmt = timeLabelFormat(frame.resolution);
  std::size_t n = visible.size();
  for (int i = 0; i <= 4; i++) {
    auto idx = static_cast<std::size_t>(std::floor(i / 4.0 * static_cast<double>(n - 1)));
    if (idx >= n) continue;
    std::string label = formatTimestampMs(visible[idx].t, fmt);
    float x = static_cast<float>(meta.barCenterX(static_cast<int>(idx)));
    out.addText(label, x - measure_(label, fontPx) / 2,
                static_cast<float>(plot.y + plot.h + 14), fontPx, theme_.textDim);
  }
}

std::string formatFrameHeader(const FrameConfig& frame, const FrameState* state,
                              std::int64_t nowMs) {
  std::size_t barCount = state ? state->bars.size() : 0;
  std::string s = frame.label + " " + frame.resolution;
  s += " | Bars: " + std::to_string(barCount);
  s += " | Updated: " + formatAge(state ? state->updatedAtMs : 0, nowMs);
  if (!state) return s + " | Ready";

  if (!state->source.empty()) s += " | Source: " + state->source;
  if (state->hasCoverage) {
    long pct = std::lround(state->coverage.coveragePct * 100);
    if (pct < 99) s += " | cov " + std::to_string(pct) + "%";
    if (state->coverage.gapCount > 0) {
      s += " | gaps " + std::to_string(state->coverage.gapCount);
    } else if (state->coverage.missingBars > 0) {
      s += " | missing " + std::to_string(state->coverage.missingBars);
    }
  }

  if (!state->error.empty()) s += " | Error";
  else if (barCount == 0 && state->loading) s += " | Loading...";
  else s += " | Ready";
  return s;
}

} // namespace mtc
