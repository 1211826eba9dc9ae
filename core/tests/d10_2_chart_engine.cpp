// D10.2 — Chart engine: focus, history, quotes, bar close, drag, capture, meta

#include "mtc/data/Resolution.hpp"
#include "mtc/engine/ChartEngine.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.8f expected %.8f)\n", msg, a, b);
    std::exit(1);
  }
}

// Answers synchronously with a flat zigzag around 1.1000.
class FlatHistory : public mtc::HistoryProvider {
public:
  void getHistorySeries(const mtc::HistoryRequest& req, mtc::HistoryCallback done) override {
    calls++;
    lastSymbol = req.symbol;
    mtc::HistoryResponse res;
    std::int64_t resMs = mtc::resolutionMs(req.resolution);
    std::string json = "[";
    int i = 0;
    char buf[160];
    for (std::int64_t t = mtc::bucketStart(req.fromMs, resMs); t <= req.toMs; t += resMs, i++) {
      double o = 1.1000 + ((i % 2) ? 0.0002 : -0.0002);
      double c = 1.1000 + ((i % 2) ? -0.0002 : 0.0002);
      std::snprintf(buf, sizeof(buf), "%s{\"t\":%lld,\"o\":%.5f,\"h\":%.5f,\"l\":%.5f,\"c\":%.5f}",
                    i ? "," : "", static_cast<long long>(t), o, 1.1005, 1.0995, c);
      json += buf;
    }
    json += "]";
    res.ok = true;
    res.barsJson = json;
    res.fetchedAtMs = req.toMs;
    res.source = "test";
    done(res);
  }

  int calls{0};
  std::string lastSymbol;
};

class FixedConstraints : public mtc::ConstraintsProvider {
public:
  void getInstrumentConstraints(const std::string&, mtc::ConstraintsCallback done) override {
    mtc::ConstraintsResponse res;
    res.ok = true;
    res.constraints.minStopDistance = 0.0010;
    res.constraints.sessionOpen = 1;
    done(res);
  }
};

int main() {
  const std::int64_t now0 = mtc::bucketStart(1700000000000LL, 14400000) + 60000;
  std::int64_t clock = now0;

  FlatHistory history;
  FixedConstraints constraints;
  mtc::ChartEngine engine;
  engine.setClock([&clock]() { return clock; });
  engine.setHistoryProvider(&history);
  engine.setConstraintsProvider(&constraints);

  std::vector<mtc::SymbolChangeEvent> symbolEvents;
  std::vector<mtc::BarCloseEvent> closes;
  std::vector<mtc::LevelUpdateEvent> updates;
  std::vector<mtc::CaptureEvent> captures;
  engine.symbolChanges().subscribe([&](const mtc::SymbolChangeEvent& e) { symbolEvents.push_back(e); });
  engine.barCloses().subscribe([&](const mtc::BarCloseEvent& e) { closes.push_back(e); });
  engine.levelUpdates().subscribe([&](const mtc::LevelUpdateEvent& e) { updates.push_back(e); });
  engine.captures().subscribe([&](const mtc::CaptureEvent& e) { captures.push_back(e); });

  // ---- Test 1: focus loads every active frame ----
  {
    requireTrue(!engine.focusSymbol("   "), "blank symbol rejected");
    requireTrue(engine.focusSymbol("fx:eurusd"), "focused");
    requireTrue(engine.symbol() == "EURUSD", "normalized key");
    requireTrue(symbolEvents.size() == 1 && symbolEvents[0].symbol == "EURUSD", "symbol event");
    requireTrue(history.calls == 4, "one request per default frame");
    requireTrue(history.lastSymbol == "EURUSD", "request symbol");
    for (const auto& id : engine.frames().activeIds()) {
      const mtc::FrameState* st = engine.frames().state(id);
      requireTrue(st && st->bars.size() >= 2, "bars loaded");
      requireTrue(st->source == "test", "source recorded");
    }
    requireTrue(!engine.fetcher().inFlight(), "cycle settled");
    requireClose(engine.instrumentStatus().minStopDistance, 0.0010, 1e-12, "constraints applied");
    requireTrue(!engine.focusSymbol("EURUSD"), "same symbol is a no-op");
    requireTrue(symbolEvents.size() == 1, "no second event");
    std::printf("  Test 1 (focus): PASS\n");
  }

  // ---- Test 2: quotes filter by symbol and close bars ----
  {
    mtc::LiveQuote q;
    q.symbol = "GBPUSD";
    q.mid = 1.2500;
    q.hasMid = true;
    q.timestampMs = now0 + 1000;
    requireTrue(!engine.onQuote(q), "other symbol ignored");

    q.symbol = "EUR/USD";
    q.mid = 1.1003;
    requireTrue(engine.onQuote(q), "loose match accepted");
    requireTrue(engine.compositor().hasQuotePrice(), "quote level");
    requireTrue(closes.empty(), "same bucket: nothing closes");

    std::int64_t bucket5 = mtc::bucketStart(now0, 300000);
    q.mid = 1.1008;
    q.timestampMs = now0 + 300000;
    clock = q.timestampMs;
    requireTrue(engine.onQuote(q), "next bucket");
    requireTrue(closes.size() == 1, "only 5m closed");
    requireTrue(closes[0].frameId == "5m" && closes[0].resolution == "5m", "5m event");
    requireTrue(closes[0].bar.t == bucket5, "closed bar start");
    requireClose(closes[0].bar.c, 1.1003, 1e-12, "closed at the last quote");
    requireTrue(closes[0].symbol == "EURUSD", "event symbol");
    std::printf("  Test 2 (quotes): PASS\n");
  }

  // ---- Test 3: scheduled refresh ----
  {
    int before = history.calls;
    requireTrue(engine.tick() == 0, "not due yet");
    clock += 30000;
    requireTrue(engine.tick() == 1, "refresh ran");
    requireTrue(history.calls == before + 4, "four more requests");
    std::printf("  Test 3 (refresh): PASS\n");
  }

  // ---- Test 4: drag a TP through the engine ----
  {
    mtc::Position pos;
    pos.id = "7";
    pos.symbol = "EURUSD";
    pos.type = "BUY";
    pos.entryPrice = 1.0998;
    pos.takeProfit = 1.1050;
    engine.setPositions({pos});

    requireTrue(engine.resizeSurface("1H", 640, 320), "surface sized");
    const mtc::PlotMeta* meta = engine.plotMeta().find("1H");
    requireTrue(meta != nullptr, "resize rendered the frame");
    requireTrue(meta->paddedMax > 1.1050, "TP in range");

    double yFrom = meta->priceToY(1.1050);
    double yTo = meta->priceToY(1.1030);
    requireTrue(engine.pointerDown("1H", mtc::InteractionSource::Frame, 300, yFrom), "grabbed");
    requireTrue(engine.wantsWindowEvents(), "dragging");
    requireTrue(engine.pointerMove(yTo), "moved");

    mtc::DrawList list;
    mtc::FrameRenderResult mid = engine.renderFrame("1H", mtc::InteractionSource::Frame, 640, 320, list);
    int dragLevels = 0;
    bool originalKept = false;
    for (const auto& lv : mid.levels) {
      if (lv.kind == mtc::LevelKind::Drag) {
        ++dragLevels;
        requireClose(lv.price, 1.1030, 1e-9, "preview at pointer price");
      }
      if (lv.id == "pos_7_tp") originalKept = std::fabs(lv.price - 1.1050) < 1e-9;
    }
    requireTrue(dragLevels == 1, "one drag preview drawn");
    requireTrue(originalKept, "dragged level still drawn at its price");

    requireTrue(engine.pointerUp(yTo), "released");
    requireTrue(updates.size() == 1, "one update");
    requireClose(updates[0].price, 1.1030, 1e-9, "new TP");
    requireTrue(updates[0].meta.id == "7" && updates[0].meta.field == mtc::LevelField::Tp, "target");
    requireTrue(updates[0].levelId == "pos_7_tp", "update names the dragged level");
    requireTrue(!engine.click("1H", mtc::InteractionSource::Frame, yTo), "trailing click swallowed");

    // Fullscreen geometry follows the last fullscreen render, empty included.
    mtc::DrawList fsList;
    requireTrue(engine.renderFrame("1H", mtc::InteractionSource::Fullscreen, 800, 480, fsList).hasPlot,
                "fullscreen plot");
    requireTrue(engine.plotMeta().fullscreen() != nullptr, "fullscreen geometry stored");
    requireTrue(!engine.renderFrame("1D", mtc::InteractionSource::Fullscreen, 800, 480, fsList).hasPlot,
                "inactive frame has no bars");
    requireTrue(engine.plotMeta().fullscreen() == nullptr, "stale fullscreen geometry dropped");
    requireTrue(engine.plotMeta().find("1H") != nullptr, "frame geometry untouched");
    std::printf("  Test 4 (drag): PASS\n");
  }

  // ---- Test 5: capture needs pixels ----
  {
    mtc::Image img;
    requireTrue(!engine.captureSnapshot(img), "no backend, no pixels");
    requireTrue(!engine.captureAll(), "nothing to capture");
    requireTrue(captures.empty(), "no capture event");
    std::printf("  Test 5 (capture): PASS\n");
  }

  // ---- Test 6: meta and frame set ----
  {
    mtc::ChartMeta m = engine.getMeta();
    requireTrue(m.symbol == "EURUSD", "meta symbol");
    requireTrue(m.frames.size() == 4, "four frames");
    requireTrue(m.updatedAtMs >= now0, "updated");
    for (const auto& f : m.frames) requireTrue(f.bars > 0, "bars per frame");

    int before = history.calls;
    requireTrue(engine.ensureFrameActive("1h"), "already active");
    requireTrue(history.calls == before, "no refresh when unchanged");
    requireTrue(engine.toggleFrame("1D"), "added 1D");
    requireTrue(history.calls == before + 5, "forced refresh of five frames");
    requireTrue(engine.getMeta().frames.size() == 5, "five frames");
    requireTrue(engine.toggleFrame("1H"), "removed 1H");
    requireTrue(engine.plotMeta().find("1H") == nullptr, "geometry dropped");
    std::printf("  Test 6 (meta): PASS\n");
  }

  // ---- Test 7: symbol switch resets state ----
  {
    requireTrue(engine.focusSymbol("GBPUSD"), "switched");
    requireTrue(symbolEvents.size() == 2 && symbolEvents[1].previous == "EURUSD", "previous symbol");
    requireTrue(!engine.compositor().hasQuotePrice(), "quote cleared");
    requireTrue(engine.compositor().draggableLevels().empty(), "EURUSD position filtered out");
    std::printf("  Test 7 (symbol switch): PASS\n");
  }

  std::printf("D10.2 chart_engine: ALL PASS\n");
  return 0;
}
