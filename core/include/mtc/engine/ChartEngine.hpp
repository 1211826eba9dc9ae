#pragma once
#include "mtc/broker/ConstraintsProvider.hpp"
#include "mtc/broker/HistoryProvider.hpp"
#include "mtc/broker/InstrumentStatus.hpp"
#include "mtc/engine/ChartHandle.hpp"
#include "mtc/engine/EngineConfig.hpp"
#include "mtc/events/EventEmitter.hpp"
#include "mtc/export/SnapshotComposer.hpp"
#include "mtc/frames/FrameManager.hpp"
#include "mtc/frames/RefreshScheduler.hpp"
#include "mtc/geometry/PlotGeometry.hpp"
#include "mtc/history/HistoryFetcher.hpp"
#include "mtc/interaction/InteractionEngine.hpp"
#include "mtc/live/BarSynthesizer.hpp"
#include "mtc/live/Quote.hpp"
#include "mtc/live/QuoteThrottle.hpp"
#include "mtc/overlay/LevelCompositor.hpp"
#include "mtc/render/FrameRenderer.hpp"
#include "mtc/render/RenderBackend.hpp"
#include "mtc/render/SurfaceRegistry.hpp"
#include "mtc/text/GlyphAtlas.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mtc {

using EngineClock = std::function<std::int64_t()>;

// Wall clock in epoch ms.
std::int64_t systemNowMs();

// Composes the frame manager, fetcher, synthesizer, compositor, geometry
// cache, interaction engine, renderer and snapshot composer behind
// ChartHandle. Single-threaded: the host drives it with tick(), onQuote(),
// pointer events and draw(), all from one thread.
class ChartEngine : public ChartHandle {
public:
  static constexpr const char* kRefreshTaskId = "refresh";

  explicit ChartEngine(const EngineConfig& cfg = EngineConfig{});
  ~ChartEngine() override;

  ChartEngine(const ChartEngine&) = delete;
  ChartEngine& operator=(const ChartEngine&) = delete;

  void applyConfig(const EngineConfig& cfg);
  const EngineConfig& config() const { return config_; }

  void setClock(EngineClock clock);
  std::int64_t now() const { return clock_(); }

  void setHistoryProvider(HistoryProvider* provider);
  void setConstraintsProvider(ConstraintsProvider* provider) { constraintsProvider_ = provider; }
  void setConnected(bool connected);

  // Optional; without one surfaces keep their DrawLists but no pixels.
  void setRenderBackend(RenderBackend* backend) { backend_ = backend; }
  GlyphAtlas& glyphAtlas() { return atlas_; }

  void setTheme(const ChartTheme& theme);
  void setVisible(bool visible);

  // ChartHandle
  bool focusSymbol(const std::string& symbol) override;
  bool ensureFrameActive(const std::string& timeframe) override;
  bool toggleFrame(const std::string& frameId) override;
  bool setActiveFrames(const std::vector<std::string>& frameIds) override;
  void refresh() override;
  bool setOverlayVisible(OverlayToggle overlay, bool visible) override;
  bool captureAll() override;
  bool captureSnapshot(Image& out) override;
  bool captureFrameSnapshot(const std::string& frameId, Image& out) override;
  ChartMeta getMeta() const override;

  const std::string& symbol() const { return symbol_; }

  // Runs due scheduler tasks. Returns the number of task runs.
  int tick();

  // Returns true if the quote was for the focused symbol and usable.
  bool onQuote(const LiveQuote& quote);

  // External feeds, filtered to the focused symbol by the compositor.
  void setPositions(std::vector<Position> positions);
  void setOrders(std::vector<Order> orders);
  void setSetupSignals(std::vector<SetupSignal> signals);
  void setPatternEvents(std::vector<PatternEvent> events);
  void setReviewAnnotations(std::vector<ReviewAnnotation> reviews);

  void setPriceSelectMode(PriceSelectMode mode) { interaction_.setPriceSelectMode(mode); }

  // Surface-local pixel coordinates, y down.
  bool pointerDown(const std::string& frameId, InteractionSource source, double x, double y);
  bool pointerMove(double y);
  bool pointerUp(double y);
  bool click(const std::string& frameId, InteractionSource source, double y);
  bool wantsWindowEvents() const { return interaction_.wantsWindowEvents(); }

  // Surface sizes. A size change redraws that frame right away.
  bool resizeSurface(const std::string& frameId, int width, int height);
  bool resizeFullscreen(int width, int height);
  void setFullscreenFrame(const std::string& frameId);
  void clearFullscreen();

  // Redraws every dirty surface of an active frame. Returns the count.
  int draw();

  // One frame into a DrawList at the given size. Stores the plot geometry
  // so pointer input maps against what was drawn.
  FrameRenderResult renderFrame(const std::string& frameId, InteractionSource source,
                                int width, int height, DrawList& out);

  EventEmitter<SymbolChangeEvent>& symbolChanges() { return symbolChanges_; }
  EventEmitter<BarCloseEvent>& barCloses() { return barCloses_; }
  EventEmitter<PriceSelectEvent>& priceSelects() { return interaction_.priceSelects(); }
  EventEmitter<LevelUpdateEvent>& levelUpdates() { return interaction_.levelUpdates(); }
  EventEmitter<CaptureEvent>& captures() { return captures_; }

  const FrameManager& frames() const { return frames_; }
  const LevelCompositor& compositor() const { return compositor_; }
  const PlotMetaCache& plotMeta() const { return plotMeta_; }
  const InteractionEngine& interaction() const { return interaction_; }
  const HistoryFetcher& fetcher() const { return fetcher_; }
  const RefreshScheduler& scheduler() const { return scheduler_; }
  const SurfaceRegistry& surfaces() const { return surfaces_; }
  const InstrumentStatus& instrumentStatus() const { return instrument_; }

private:
  void registerRefreshTask();
  void requestConstraints();
  void onFrameSetChanged();
  void onHistoryComplete();
  void emitBarCloses(const std::vector<BarCloseEvent>& events);
  bool drawSurface(const std::string& frameId, InteractionSource source, Surface& surface);
  void markDirty() { surfaces_.markAllDirty(); }

  EngineConfig config_;
  EngineClock clock_;

  FrameManager frames_;
  HistoryFetcher fetcher_;
  LiveBarSynthesizer synth_;
  QuoteThrottle throttle_;
  LevelCompositor compositor_;
  PlotMetaCache plotMeta_;
  InteractionEngine interaction_;
  RefreshScheduler scheduler_;
  FrameRenderer renderer_;
  SurfaceRegistry surfaces_;
  GlyphAtlas atlas_;
  SnapshotComposer composer_;

  RenderBackend* backend_{nullptr};
  ConstraintsProvider* constraintsProvider_{nullptr};
  int resizeListener_{0};

  std::string symbol_;
  InstrumentStatus instrument_;
  bool connected_{true};

  bool hasBid_{false}, hasAsk_{false};
  double bid_{0}, ask_{0};
  std::int64_t quoteTsMs_{0};

  EventEmitter<SymbolChangeEvent> symbolChanges_;
  EventEmitter<BarCloseEvent> barCloses_;
  EventEmitter<CaptureEvent> captures_;

  // Pending provider callbacks check this before touching the engine.
  std::shared_ptr<ChartEngine*> self_;
};

} // namespace mtc
