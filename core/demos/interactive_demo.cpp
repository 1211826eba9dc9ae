// Interactive single-frame demo (GLFW)
// Shows one timeframe of a synthetic EURUSD feed in a window. Drag the
// position's SL/TP lines to emit level updates; with a select mode given on
// the command line (entry|sl|tp) a click prints the price under the cursor.

#include "SyntheticFeed.hpp"

#include "mtc/engine/ChartEngine.hpp"

#ifdef MTC_HAS_GLFW
#include "mtc/gl/GlfwContext.hpp"
#include "mtc/gl/GpuBufferManager.hpp"
#include "mtc/gl/Renderer.hpp"
#endif

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#ifdef MTC_HAS_GLFW

static mtc::PriceSelectMode parseMode(const char* s) {
  if (!s) return mtc::PriceSelectMode::Off;
  if (std::strcmp(s, "entry") == 0) return mtc::PriceSelectMode::Entry;
  if (std::strcmp(s, "sl") == 0) return mtc::PriceSelectMode::Sl;
  if (std::strcmp(s, "tp") == 0) return mtc::PriceSelectMode::Tp;
  return mtc::PriceSelectMode::Off;
}

int main(int argc, char** argv) {
  std::string frameId = argc > 1 ? argv[1] : "15m";

  mtc::EngineConfig cfg;
  if (const char* font = std::getenv("MTC_FONT")) cfg.fontPath = font;
  cfg.activeFrames = {frameId};

  mtc::ChartEngine engine(cfg);
  if (!engine.frames().isActive(mtc::resolveFrameId(frameId))) {
    std::fprintf(stderr, "Unknown timeframe %s\n", frameId.c_str());
    return 1;
  }
  frameId = mtc::resolveFrameId(frameId);
  engine.setPriceSelectMode(parseMode(argc > 2 ? argv[2] : nullptr));

  mtc::GlfwContext ctx("mtc interactive");
  if (!ctx.init(1100, 560)) return 1;

  mtc::Renderer renderer;
  renderer.setGlyphAtlas(&engine.glyphAtlas());
  if (!renderer.init()) {
    std::fprintf(stderr, "Renderer init failed\n");
    return 1;
  }
  mtc::GpuBufferManager bufs;

  demo::SyntheticHistory history(1.0850);
  engine.setHistoryProvider(&history);

  engine.levelUpdates().subscribe([](const mtc::LevelUpdateEvent& ev) {
    std::printf("level update %s -> %.5f (%s %s)\n", ev.levelId.c_str(), ev.price,
                ev.frameId.c_str(), mtc::levelFieldName(ev.meta.field));
  });
  engine.priceSelects().subscribe([](const mtc::PriceSelectEvent& ev) {
    std::printf("price select %s %.5f on %s\n", mtc::priceSelectModeName(ev.mode),
                ev.price, ev.frameId.c_str());
  });
  engine.barCloses().subscribe([](const mtc::BarCloseEvent& ev) {
    std::printf("bar close %s c=%.5f\n", ev.frameId.c_str(), ev.bar.c);
  });

  engine.focusSymbol("EURUSD");
  double last = history.lastClose();

  mtc::Position pos;
  pos.id = "demo";
  pos.symbol = "EURUSD";
  pos.type = "BUY";
  pos.entryPrice = last - 0.0010;
  pos.stopLoss = last - 0.0035;
  pos.takeProfit = last + 0.0030;
  engine.setPositions({pos});

  demo::Lcg rng(11);
  double mid = last;
  std::int64_t lastQuoteMs = 0;

  std::printf("Drag SL/TP lines; close the window to exit\n");
  while (!ctx.shouldClose()) {
    mtc::PointerInput in = ctx.pollInput();
    if (in.shouldClose) break;

    std::int64_t nowMs = engine.now();
    if (nowMs - lastQuoteMs >= 250) {
      mid += rng.next() * 0.00004;
      engine.onQuote(demo::makeQuote("EURUSD", mid, nowMs));
      lastQuoteMs = nowMs;
    }
    engine.tick();

    if (in.pressed) engine.pointerDown(frameId, mtc::InteractionSource::Frame, in.pressX, in.pressY);
    if (engine.wantsWindowEvents()) engine.pointerMove(in.cursorY);
    if (in.released) {
      engine.pointerUp(in.releaseY);
      engine.click(frameId, mtc::InteractionSource::Frame, in.releaseY);
    }

    mtc::DrawList list;
    engine.renderFrame(frameId, mtc::InteractionSource::Frame, ctx.width(), ctx.height(), list);
    renderer.render(list, bufs);
    ctx.swapBuffers();
  }
  return 0;
}

#else

int main() {
  std::printf("interactive demo needs GLFW; rebuild with glfw3 installed\n");
  return 0;
}

#endif
