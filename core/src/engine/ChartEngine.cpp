#include "mtc/engine/ChartEngine.hpp"
#include "mtc/data/Symbols.hpp"
#include "mtc/export/PngWriter.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <utility>

namespace mtc {

std::int64_t systemNowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

ChartEngine::ChartEngine(const EngineConfig& cfg)
  : clock_(systemNowMs),
    fetcher_(frames_),
    synth_(frames_),
    interaction_(plotMeta_),
    self_(std::make_shared<ChartEngine*>(this)) {
  fetcher_.setCompletionHook([this](std::uint64_t) { onHistoryComplete(); });

  resizeListener_ = surfaces_.addResizeListener(
      [this](const std::string& frameId, int, int) {
        if (!frames_.isActive(frameId)) return;
        if (Surface* s = surfaces_.find(frameId)) drawSurface(frameId, InteractionSource::Frame, *s);
        if (surfaces_.fullscreenFrame() == frameId) {
          if (Surface* fs = surfaces_.fullscreen()) drawSurface(frameId, InteractionSource::Fullscreen, *fs);
        }
      });

  renderer_.setTextMeasure(makeTextMeasure(&atlas_));
  composer_.setGlyphAtlas(&atlas_);
  applyConfig(cfg);
}

ChartEngine::~ChartEngine() {
  surfaces_.removeResizeListener(resizeListener_);
}

void ChartEngine::applyConfig(const EngineConfig& cfg) {
  bool fontChanged = cfg.fontPath != config_.fontPath || !atlas_.fontLoaded();
  config_ = cfg;

  FrameManagerConfig fm;
  fm.maxActiveFrames = cfg.maxActiveFrames;
  frames_.setConfig(fm);
  if (!cfg.activeFrames.empty()) frames_.setActiveFrames(cfg.activeFrames);

  QuoteThrottleConfig qt;
  qt.repeatWindowMs = cfg.quoteRepeatWindowMs;
  qt.minIntervalMs = cfg.quoteMinIntervalMs;
  throttle_.setConfig(qt);

  LevelSelectionConfig sel;
  sel.dedupBandFraction = cfg.dedupBandFraction;
  sel.maxSelected = cfg.maxSelectedLevels;
  compositor_.setSelectionConfig(sel);

  InteractionConfig ic;
  ic.hitTolerancePx = cfg.hitTolerancePx;
  ic.dragConfirmPx = cfg.dragConfirmPx;
  interaction_.setConfig(ic);

  FrameRenderConfig rc = renderer_.config();
  rc.liveMarkerFreshMs = cfg.liveMarkerFreshMs;
  renderer_.setConfig(rc);

  fetcher_.setBrokerLabel(cfg.brokerLabel);

  if (fontChanged && !cfg.fontPath.empty()) {
    if (atlas_.loadFontFile(cfg.fontPath)) {
      atlas_.ensureAscii();
    } else {
      std::fprintf(stderr, "ChartEngine::applyConfig: font %s not loaded, text is estimated\n",
                   cfg.fontPath.c_str());
    }
  }

  if (!symbol_.empty()) registerRefreshTask();
  markDirty();
}

void ChartEngine::setClock(EngineClock clock) {
  clock_ = clock ? std::move(clock) : EngineClock(systemNowMs);
}

void ChartEngine::setHistoryProvider(HistoryProvider* provider) {
  fetcher_.setProvider(provider);
}

void ChartEngine::setConnected(bool connected) {
  if (connected_ == connected) return;
  connected_ = connected;
  fetcher_.setConnected(connected);
  if (connected && !symbol_.empty()) fetcher_.refresh(symbol_, true, now());
  markDirty();
}

void ChartEngine::setTheme(const ChartTheme& theme) {
  compositor_.setTheme(theme);
  renderer_.setTheme(theme);
  composer_.setTheme(theme);
  markDirty();
}

void ChartEngine::setVisible(bool visible) {
  scheduler_.setVisible(visible);
}

void ChartEngine::registerRefreshTask() {
  SchedulerTask task;
  task.id = kRefreshTaskId;
  task.intervalMs = config_.refreshIntervalMs;
  task.jitterPct = config_.refreshJitter;
  task.visibility = VisibilityMode::Foreground;
  task.priority = TaskPriority::Low;
  task.run = [this]() {
    if (!symbol_.empty()) fetcher_.refresh(symbol_, false, now());
  };
  scheduler_.registerTask(task, now());
}

bool ChartEngine::focusSymbol(const std::string& symbol) {
  std::string key = normalizeSymbolKey(symbol);
  if (key.empty() || key == symbol_) return false;

  std::string previous = symbol_;
  symbol_ = key;

  fetcher_.invalidate();
  frames_.resetAll();
  plotMeta_.clear();
  interaction_.cancel();
  throttle_.reset();
  compositor_.setSymbol(key);
  compositor_.clearQuote();
  compositor_.setMinStopDistance(0);
  hasBid_ = hasAsk_ = false;
  bid_ = ask_ = 0;
  quoteTsMs_ = 0;
  instrument_ = InstrumentStatus{};

  fetcher_.refresh(symbol_, true, now());
  registerRefreshTask();
  requestConstraints();
  markDirty();

  SymbolChangeEvent ev;
  ev.symbol = symbol_;
  ev.previous = previous;
  symbolChanges_.emit(ev);
  return true;
}

void ChartEngine::requestConstraints() {
  if (!constraintsProvider_ || symbol_.empty()) return;
  instrument_.loading = true;

  std::weak_ptr<ChartEngine*> weak = self_;
  std::string requested = symbol_;
  constraintsProvider_->getInstrumentConstraints(requested,
      [weak, requested](const ConstraintsResponse& res) {
        auto alive = weak.lock();
        if (!alive) return;
        ChartEngine& self = **alive;
        if (self.symbol_ != requested) return;
        self.instrument_ = applyConstraintsResponse(res, self.config_.brokerLabel, self.now());
        if (!self.instrument_.error.empty()) {
          std::fprintf(stderr, "ChartEngine::requestConstraints: %s: %s\n",
                       requested.c_str(), self.instrument_.error.c_str());
        }
        self.compositor_.setMinStopDistance(self.instrument_.minStopDistance);
        self.markDirty();
      });
}

void ChartEngine::onFrameSetChanged() {
  for (const auto& id : surfaces_.ids()) {
    if (!frames_.isActive(id)) plotMeta_.erase(id);
  }
  if (!frames_.isActive(surfaces_.fullscreenFrame())) {
    surfaces_.clearFullscreen();
    plotMeta_.clearFullscreen();
  }
  if (!symbol_.empty()) fetcher_.refresh(symbol_, true, now());
  markDirty();
}

bool ChartEngine::ensureFrameActive(const std::string& timeframe) {
  std::vector<std::string> before = frames_.activeIds();
  if (!frames_.ensureFrameActive(timeframe)) return false;
  if (frames_.activeIds() != before) onFrameSetChanged();
  return true;
}

bool ChartEngine::toggleFrame(const std::string& frameId) {
  if (!frames_.toggleFrame(frameId)) return false;
  onFrameSetChanged();
  return true;
}

bool ChartEngine::setActiveFrames(const std::vector<std::string>& frameIds) {
  if (!frames_.setActiveFrames(frameIds)) return false;
  onFrameSetChanged();
  return true;
}

void ChartEngine::refresh() {
  if (symbol_.empty()) return;
  fetcher_.refresh(symbol_, true, now());
  requestConstraints();
  markDirty();
}

bool ChartEngine::setOverlayVisible(OverlayToggle overlay, bool visible) {
  if (!compositor_.setToggle(overlay, visible)) return false;
  markDirty();
  return true;
}

int ChartEngine::tick() {
  return scheduler_.advance(now());
}

void ChartEngine::emitBarCloses(const std::vector<BarCloseEvent>& events) {
  for (const auto& ev : events) barCloses_.emit(ev);
}

void ChartEngine::onHistoryComplete() {
  // Fresh history replaced the tail; put the live price back on it.
  if (throttle_.hasLast() && !symbol_.empty()) {
    const AcceptedQuote& q = throttle_.last();
    emitBarCloses(synth_.applyQuote(symbol_, q.price, q.ts));
  }
  markDirty();
}

bool ChartEngine::onQuote(const LiveQuote& quote) {
  if (symbol_.empty()) return false;
  if (normalizeSymbolLoose(quote.symbol) != normalizeSymbolLoose(symbol_)) return false;

  double price = 0;
  if (!resolveQuotePrice(quote, price)) return false;
  std::int64_t ts = normalizeQuoteTs(quote.timestampMs);
  if (ts <= 0) ts = now();

  hasBid_ = quote.hasBid && quote.bid > 0;
  hasAsk_ = quote.hasAsk && quote.ask > 0;
  bid_ = hasBid_ ? quote.bid : 0;
  ask_ = hasAsk_ ? quote.ask : 0;
  quoteTsMs_ = ts;
  compositor_.setQuotePrice(price);

  if (throttle_.accept(price, ts)) {
    emitBarCloses(synth_.applyQuote(symbol_, price, ts));
  }
  markDirty();
  return true;
}

void ChartEngine::setPositions(std::vector<Position> positions) {
  compositor_.setPositions(std::move(positions));
  markDirty();
}

void ChartEngine::setOrders(std::vector<Order> orders) {
  compositor_.setOrders(std::move(orders));
  markDirty();
}

void ChartEngine::setSetupSignals(std::vector<SetupSignal> signals) {
  compositor_.setSetupSignals(std::move(signals));
  markDirty();
}

void ChartEngine::setPatternEvents(std::vector<PatternEvent> events) {
  compositor_.setPatternEvents(std::move(events));
  markDirty();
}

void ChartEngine::setReviewAnnotations(std::vector<ReviewAnnotation> reviews) {
  compositor_.setReviewAnnotations(std::move(reviews));
  markDirty();
}

bool ChartEngine::pointerDown(const std::string& frameId, InteractionSource source,
                              double x, double y) {
  if (!interaction_.pointerDown(frameId, source, x, y, compositor_.draggableLevels())) return false;
  markDirty();
  return true;
}

bool ChartEngine::pointerMove(double y) {
  if (!interaction_.pointerMove(y)) return false;
  markDirty();
  return true;
}

bool ChartEngine::pointerUp(double y) {
  bool wasDragging = interaction_.wantsWindowEvents();
  bool emitted = interaction_.pointerUp(y);
  if (wasDragging) markDirty();
  return emitted;
}

bool ChartEngine::click(const std::string& frameId, InteractionSource source, double y) {
  return interaction_.click(frameId, source, y);
}

bool ChartEngine::resizeSurface(const std::string& frameId, int width, int height) {
  return surfaces_.resize(frameId, width, height);
}

bool ChartEngine::resizeFullscreen(int width, int height) {
  return surfaces_.resizeFullscreen(width, height);
}

void ChartEngine::setFullscreenFrame(const std::string& frameId) {
  if (!frames_.isActive(frameId)) return;
  surfaces_.setFullscreenFrame(frameId);
  plotMeta_.clearFullscreen();
}

void ChartEngine::clearFullscreen() {
  surfaces_.clearFullscreen();
  plotMeta_.clearFullscreen();
}

FrameRenderResult ChartEngine::renderFrame(const std::string& frameId, InteractionSource source,
                                           int width, int height, DrawList& out) {
  FrameRenderResult result;
  const FrameConfig* frame = findFramePreset(frameId);
  if (!frame) return result;

  FrameRenderInput in;
  in.frame = frame;
  in.state = frames_.state(frameId);
  in.compositor = &compositor_;
  in.width = width;
  in.height = height;
  in.hasBid = hasBid_;
  in.hasAsk = hasAsk_;
  in.bid = bid_;
  in.ask = ask_;
  in.hasQuotePrice = compositor_.hasQuotePrice();
  in.quotePrice = compositor_.quotePrice();
  in.quoteTsMs = quoteTsMs_;
  in.sessionOpen = instrument_.sessionOpen;
  in.connected = connected_;
  in.brokerLabel = config_.brokerLabel;
  in.nowMs = now();

  const DragState* drag = interaction_.drag();
  if (drag && drag->frameId == frameId && drag->source == source) {
    in.dragPreview = interaction_.dragPreview();
  }

  result = renderer_.render(in, out);
  if (result.hasPlot) {
    if (source == InteractionSource::Fullscreen) {
      plotMeta_.storeFullscreen(result.meta);
    } else {
      plotMeta_.store(result.meta);
    }
  } else if (source == InteractionSource::Fullscreen) {
    plotMeta_.clearFullscreen();
  } else {
    plotMeta_.erase(frameId);
  }
  return result;
}

bool ChartEngine::drawSurface(const std::string& frameId, InteractionSource source,
                              Surface& surface) {
  if (surface.width <= 0 || surface.height <= 0) return false;
  DrawList list;
  renderFrame(frameId, source, surface.width, surface.height, list);
  surface.dirty = false;
  if (!backend_) return true;
  if (!backend_->render(list, surface.image)) {
    surface.image = Image{};
    return false;
  }
  return true;
}

int ChartEngine::draw() {
  int drawn = 0;
  for (const auto& id : frames_.activeIds()) {
    Surface* s = surfaces_.find(id);
    if (!s || !s->dirty) continue;
    if (drawSurface(id, InteractionSource::Frame, *s)) drawn++;
  }
  if (surfaces_.hasFullscreen()) {
    Surface* fs = surfaces_.fullscreen();
    if (fs && fs->dirty && drawSurface(surfaces_.fullscreenFrame(), InteractionSource::Fullscreen, *fs)) {
      drawn++;
    }
  }
  return drawn;
}

bool ChartEngine::captureFrameSnapshot(const std::string& frameId, Image& out) {
  if (!frames_.isActive(frameId)) return false;
  const FrameState* st = frames_.state(frameId);
  Surface* s = surfaces_.find(frameId);
  if (!st || st->bars.empty() || !s) return false;
  if (s->dirty || s->image.empty()) drawSurface(frameId, InteractionSource::Frame, *s);
  if (s->image.empty()) return false;
  out = s->image;
  return true;
}

bool ChartEngine::captureSnapshot(Image& out) {
  if (symbol_.empty()) return false;
  std::vector<SnapshotEntry> entries;
  for (const FrameConfig* frame : frames_.activeConfigs()) {
    const FrameState* st = frames_.state(frame->id);
    Surface* s = surfaces_.find(frame->id);
    if (!st || st->bars.empty() || !s) continue;
    if (s->dirty || s->image.empty()) drawSurface(frame->id, InteractionSource::Frame, *s);

    SnapshotEntry e;
    e.label = frame->label;
    e.bars = st->bars.size();
    e.updatedAtMs = st->updatedAtMs;
    e.image = &s->image;
    entries.push_back(e);
  }
  return composer_.compose(symbol_, entries, now(), out);
}

bool ChartEngine::captureAll() {
  Image img;
  if (!captureSnapshot(img)) {
    std::fprintf(stderr, "ChartEngine::captureAll: nothing to capture\n");
    return false;
  }
  CaptureEvent ev;
  ev.png = encodePNG(img);
  ev.width = img.width;
  ev.height = img.height;
  ev.meta = getMeta();
  captures_.emit(ev);
  return true;
}

ChartMeta ChartEngine::getMeta() const {
  ChartMeta meta;
  meta.symbol = symbol_;
  for (const FrameConfig* frame : frames_.activeConfigs()) {
    FrameMeta fm;
    fm.resolution = frame->resolution;
    fm.label = frame->label;
    if (const FrameState* st = frames_.state(frame->id)) {
      fm.bars = static_cast<std::uint32_t>(st->bars.size());
      fm.updatedAtMs = st->updatedAtMs;
    }
    meta.updatedAtMs = std::max(meta.updatedAtMs, fm.updatedAtMs);
    meta.frames.push_back(fm);
  }
  return meta;
}

} // namespace mtc
