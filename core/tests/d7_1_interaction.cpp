// D7.1 — Interaction: level drag, click suppression, price select

#include "mtc/interaction/InteractionEngine.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
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

static mtc::PlotMeta makeMeta(const std::string& frameId) {
  mtc::PlotMeta m;
  m.frameId = frameId;
  m.resolution = "15m";
  m.plot = {44, 18, 500, 400};
  m.paddedMin = 1.1000;
  m.paddedMax = 1.1100;
  m.priceRange = 0.0100;
  m.barCount = 50;
  return m;
}

static mtc::LevelList tpLevel() {
  mtc::OverlayLevel tp;
  tp.id = "pos-7-tp";
  tp.kind = mtc::LevelKind::Position;
  tp.price = 1.1050;
  tp.label = "TP";
  tp.draggable = true;
  tp.meta.entity = mtc::LevelEntity::Position;
  tp.meta.id = "7";
  tp.meta.field = mtc::LevelField::Tp;
  tp.meta.side = "buy";
  tp.meta.symbol = "EURUSD";
  return {tp};
}

int main() {
  // ---- Test 1: drag a TP from 1.1050 to 1.1075 ----
  {
    mtc::PlotMetaCache cache;
    cache.store(makeMeta("15m"));
    mtc::InteractionEngine ix(cache);
    std::vector<mtc::LevelUpdateEvent> updates;
    int selects = 0;
    ix.levelUpdates().subscribe([&](const mtc::LevelUpdateEvent& e) { updates.push_back(e); });
    ix.priceSelects().subscribe([&](const mtc::PriceSelectEvent&) { ++selects; });
    ix.setPriceSelectMode(mtc::PriceSelectMode::Entry);

    const mtc::PlotMeta* m = cache.find("15m");
    double yFrom = m->priceToY(1.1050);
    double yTo = m->priceToY(1.1075);

    requireTrue(ix.pointerDown("15m", mtc::InteractionSource::Frame, 200, yFrom + 3, tpLevel()),
                "drag starts within tolerance");
    requireTrue(ix.wantsWindowEvents(), "window events while dragging");
    requireTrue(ix.dragPreview() != nullptr, "preview");
    requireTrue(ix.dragPreview()->kind == mtc::LevelKind::Drag, "preview kind");
    requireTrue(ix.dragPreview()->id == "drag_pos-7-tp", "preview has its own id");

    requireTrue(ix.pointerMove(yTo), "moved");
    requireClose(ix.dragPreview()->price, 1.1075, 1e-9, "preview follows");
    requireTrue(ix.pointerUp(yTo), "emitted");
    requireTrue(updates.size() == 1, "one update");
    requireClose(updates[0].price, 1.1075, 1e-9, "new price");
    requireTrue(updates[0].levelId == "pos-7-tp", "level id");
    requireTrue(updates[0].resolution == "15m", "resolution");
    requireTrue(updates[0].hasMeta, "meta present");
    requireTrue(updates[0].meta.field == mtc::LevelField::Tp, "field");
    requireTrue(updates[0].meta.id == "7", "entity id");

    // The click that follows the release is swallowed.
    requireTrue(!ix.click("15m", mtc::InteractionSource::Frame, yTo), "click swallowed");
    requireTrue(selects == 0, "no price select after drag");
    requireTrue(ix.state() == mtc::GestureState::Idle, "idle");

    requireTrue(ix.click("15m", mtc::InteractionSource::Frame, yTo), "next click selects");
    requireTrue(selects == 1, "price select");
    std::printf("  Test 1 (TP drag): PASS\n");
  }

  // ---- Test 2: sub-threshold move is a click ----
  {
    mtc::PlotMetaCache cache;
    cache.store(makeMeta("15m"));
    mtc::InteractionEngine ix(cache);
    int updates = 0;
    std::vector<double> selected;
    ix.levelUpdates().subscribe([&](const mtc::LevelUpdateEvent&) { ++updates; });
    ix.priceSelects().subscribe([&](const mtc::PriceSelectEvent& e) { selected.push_back(e.price); });
    ix.setPriceSelectMode(mtc::PriceSelectMode::Sl);

    double y = cache.find("15m")->priceToY(1.1050);
    requireTrue(ix.pointerDown("15m", mtc::InteractionSource::Frame, 200, y, tpLevel()), "down");
    ix.pointerMove(y + 1.5);
    requireTrue(!ix.pointerUp(y + 1.5), "no update");
    requireTrue(updates == 0, "no level update");
    requireTrue(ix.click("15m", mtc::InteractionSource::Frame, y), "click runs");
    requireTrue(selected.size() == 1, "one select");
    requireClose(selected[0], 1.1050, 1e-9, "select price");
    std::printf("  Test 2 (click threshold): PASS\n");
  }

  // ---- Test 3: misses ----
  {
    mtc::PlotMetaCache cache;
    cache.store(makeMeta("15m"));
    mtc::InteractionEngine ix(cache);
    double y = cache.find("15m")->priceToY(1.1050);
    requireTrue(!ix.pointerDown("15m", mtc::InteractionSource::Frame, 200, y + 10, tpLevel()),
                "outside tolerance");
    requireTrue(!ix.pointerDown("15m", mtc::InteractionSource::Frame, 10, y, tpLevel()),
                "left of the plot");
    requireTrue(!ix.pointerDown("1H", mtc::InteractionSource::Frame, 200, y, tpLevel()),
                "frame never rendered");
    requireTrue(!ix.pointerDown("15m", mtc::InteractionSource::Fullscreen, 200, y, tpLevel()),
                "no fullscreen meta");

    mtc::LevelList fixed = tpLevel();
    fixed[0].draggable = false;
    requireTrue(!ix.pointerDown("15m", mtc::InteractionSource::Frame, 200, y, fixed),
                "not draggable");
    requireTrue(!ix.click("15m", mtc::InteractionSource::Frame, y), "select mode off");
    std::printf("  Test 3 (misses): PASS\n");
  }

  // ---- Test 4: nearest of two levels wins ----
  {
    mtc::PlotMeta m = makeMeta("15m");
    mtc::LevelList lv = tpLevel();
    mtc::OverlayLevel sl = lv[0];
    sl.id = "pos-7-sl";
    sl.price = 1.1052;
    lv.push_back(sl);
    const mtc::OverlayLevel* hit = mtc::findDraggableLevel(m, m.priceToY(1.10515), lv, 6);
    requireTrue(hit && hit->id == "pos-7-sl", "nearest");
    std::printf("  Test 4 (nearest level): PASS\n");
  }

  // ---- Test 5: fullscreen source uses the fullscreen meta ----
  {
    mtc::PlotMetaCache cache;
    mtc::PlotMeta full = makeMeta("1H");
    full.resolution = "1H";
    full.plot = {44, 18, 1200, 800};
    cache.storeFullscreen(full);
    mtc::InteractionEngine ix(cache);
    std::vector<mtc::LevelUpdateEvent> updates;
    ix.levelUpdates().subscribe([&](const mtc::LevelUpdateEvent& e) { updates.push_back(e); });

    double y = full.priceToY(1.1050);
    requireTrue(ix.pointerDown("1H", mtc::InteractionSource::Fullscreen, 600, y, tpLevel()), "down");
    ix.pointerMove(full.priceToY(1.1020));
    // The cache may change mid-drag; the gesture keeps its own transform.
    cache.clear();
    requireTrue(ix.pointerUp(full.priceToY(1.1020)), "released");
    requireTrue(updates.size() == 1, "one update");
    requireClose(updates[0].price, 1.1020, 1e-9, "price");
    requireTrue(updates[0].source == mtc::InteractionSource::Fullscreen, "source");
    std::printf("  Test 5 (fullscreen): PASS\n");
  }

  // ---- Test 6: cancel ----
  {
    mtc::PlotMetaCache cache;
    cache.store(makeMeta("15m"));
    mtc::InteractionEngine ix(cache);
    int updates = 0;
    ix.levelUpdates().subscribe([&](const mtc::LevelUpdateEvent&) { ++updates; });
    double y = cache.find("15m")->priceToY(1.1050);
    ix.pointerDown("15m", mtc::InteractionSource::Frame, 200, y, tpLevel());
    ix.pointerMove(y + 40);
    ix.cancel();
    requireTrue(!ix.wantsWindowEvents(), "released");
    requireTrue(!ix.pointerUp(y + 40), "nothing emitted");
    requireTrue(updates == 0, "no update");
    std::printf("  Test 6 (cancel): PASS\n");
  }

  std::printf("D7.1 interaction: ALL PASS\n");
  return 0;
}
