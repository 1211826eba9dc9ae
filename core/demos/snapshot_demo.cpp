// Multi-timeframe snapshot demo
// Feeds synthetic history and quotes into a ChartEngine, renders every
// active frame offscreen (OSMesa) and writes the stacked composite as PNG.
// Without OSMesa it still runs the engine and prints each frame's draw list.

#include "SyntheticFeed.hpp"

#include "mtc/engine/ChartEngine.hpp"
#include "mtc/export/PngWriter.hpp"

#ifdef MTC_HAS_OSMESA
#include "mtc/gl/GlRenderBackend.hpp"
#include "mtc/gl/OsMesaContext.hpp"
#endif

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static constexpr int W = 900;
static constexpr int H = 320;

int main(int argc, char** argv) {
  const char* outPath = argc > 1 ? argv[1] : "mtc_snapshot.png";

  mtc::EngineConfig cfg;
  if (const char* font = std::getenv("MTC_FONT")) cfg.fontPath = font;
  if (const char* cfgPath = std::getenv("MTC_CONFIG")) {
    mtc::loadEngineConfigFile(cfgPath, cfg);
  }

  std::int64_t nowMs = 1718000000000LL;   // fixed so runs are comparable
  mtc::ChartEngine engine(cfg);
  engine.setClock([&nowMs]() { return nowMs; });

  demo::SyntheticHistory history(1.0850);
  engine.setHistoryProvider(&history);

#ifdef MTC_HAS_OSMESA
  mtc::OsMesaContext ctx;
  mtc::GlRenderBackend backend(ctx);
  if (ctx.init(W, H) && backend.init(&engine.glyphAtlas())) {
    engine.setRenderBackend(&backend);
  } else {
    std::fprintf(stderr, "OSMesa unavailable, drawing without pixels\n");
  }
#endif

  engine.barCloses().subscribe([](const mtc::BarCloseEvent& ev) {
    std::printf("bar close %s %s t=%lld c=%.5f\n", ev.symbol.c_str(), ev.frameId.c_str(),
                static_cast<long long>(ev.bar.t), ev.bar.c);
  });

  engine.focusSymbol("EURUSD");
  for (const auto& id : engine.frames().activeIds()) engine.resizeSurface(id, W, H);

  double last = history.lastClose();

  mtc::Position pos;
  pos.id = "p1";
  pos.symbol = "EURUSD";
  pos.type = "BUY";
  pos.entryPrice = last - 0.0012;
  pos.stopLoss = last - 0.0040;
  pos.takeProfit = last + 0.0030;
  engine.setPositions({pos});

  mtc::Order order;
  order.id = "o1";
  order.symbol = "EURUSD";
  order.side = "SELL";
  order.type = "limit";
  order.price = last + 0.0018;
  engine.setOrders({order});

  // A minute of quotes, one every 1.5s.
  demo::Lcg rng(7);
  double mid = last;
  for (int i = 0; i < 40; ++i) {
    nowMs += 1500;
    mid += rng.next() * 0.00006;
    engine.onQuote(demo::makeQuote("EURUSD", mid, nowMs));
    engine.tick();
  }

  engine.draw();

  mtc::ChartMeta meta = engine.getMeta();
  std::printf("%s: %zu frames\n", meta.symbol.c_str(), meta.frames.size());
  for (const auto& f : meta.frames) {
    std::printf("  %-4s %u bars\n", f.label.c_str(), f.bars);
  }

  for (const auto& id : engine.frames().activeIds()) {
    mtc::DrawList list;
    mtc::FrameRenderResult r = engine.renderFrame(id, mtc::InteractionSource::Frame, W, H, list);
    std::printf("  %s: %zu batches, %zu levels, range %.5f..%.5f\n", id.c_str(),
                list.batches().size(), r.levels.size(), r.meta.paddedMin, r.meta.paddedMax);
  }

  mtc::Image composite;
  if (!engine.captureSnapshot(composite)) {
    std::printf("No snapshot (no pixels)\n");
    return 0;
  }
  if (!mtc::writePNG(outPath, composite)) {
    std::fprintf(stderr, "Failed to write %s\n", outPath);
    return 1;
  }
  std::printf("Wrote %s (%dx%d)\n", outPath, composite.width, composite.height);
  return 0;
}
