// D5.1 — Overlay levels: selection, dedup band, feeds filtering, finalize

#include "mtc/overlay/LevelCompositor.hpp"
#include "mtc/overlay/PatternLevels.hpp"
#include "mtc/overlay/Sessions.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static mtc::OverlayLevel level(const std::string& label, mtc::LevelKind kind, double price, int priority) {
  mtc::OverlayLevel lv;
  lv.label = label;
  lv.kind = kind;
  lv.price = price;
  lv.priority = priority;
  return lv;
}

static bool hasLabel(const mtc::LevelList& levels, const std::string& label) {
  return std::any_of(levels.begin(), levels.end(),
                     [&](const mtc::OverlayLevel& lv) { return lv.label == label; });
}

static mtc::CandleSeries rampBars(int n, std::int64_t t0, std::int64_t step, double p0, double dp) {
  mtc::CandleSeries out;
  for (int i = 0; i < n; i++) {
    mtc::Candle c;
    c.t = t0 + i * step;
    c.o = p0 + i * dp;
    c.c = c.o + dp;
    c.h = std::max(c.o, c.c) + 0.0002;
    c.l = std::min(c.o, c.c) - 0.0002;
    out.push_back(c);
  }
  return out;
}

int main() {
  const mtc::FrameConfig& f15 = *mtc::findFramePreset("15m");

  // ---- Test 1: near-duplicate keeps the higher priority ----
  {
    mtc::LevelList cands = {
      level("low prio", mtc::LevelKind::Setup, 1.10052, 5),
      level("high prio", mtc::LevelKind::Setup, 1.10050, 9),
    };
    mtc::LevelList out = mtc::selectLevels(cands, 0.01, mtc::LevelSelectionConfig{});
    requireTrue(out.size() == 1, "one survives");
    requireTrue(out[0].label == "high prio", "priority 9 wins");
    std::printf("  Test 1 (dedup band): PASS\n");
  }

  // ---- Test 2: at most 6 + forced, non-forced spaced apart ----
  {
    mtc::LevelList cands;
    for (int i = 0; i < 20; i++) {
      cands.push_back(level("L" + std::to_string(i), mtc::LevelKind::Pattern, 1.0 + i * 0.001, i % 7));
    }
    cands.push_back(level("pos", mtc::LevelKind::Position, 1.0105, 0));
    cands.push_back(level("ord", mtc::LevelKind::Order, 1.0105, 0));
    mtc::LevelSelectionConfig cfg;
    mtc::LevelList out = mtc::selectLevels(cands, 0.05, cfg);
    int forced = 0;
    for (const auto& lv : out) forced += mtc::isForcedKind(lv.kind) ? 1 : 0;
    requireTrue(forced == 2, "forced kept even when near each other");
    requireTrue(out.size() <= 6 + 2u, "cap");
    double tol = 0.05 * cfg.dedupBandFraction;
    for (std::size_t i = 0; i < out.size(); i++) {
      for (std::size_t j = i + 1; j < out.size(); j++) {
        if (mtc::isForcedKind(out[i].kind) || mtc::isForcedKind(out[j].kind)) continue;
        requireTrue(std::fabs(out[i].price - out[j].price) >= tol, "spaced");
      }
    }
    std::printf("  Test 2 (cap and spacing): PASS\n");
  }

  // ---- Test 3: identical ids collapse ----
  {
    mtc::OverlayLevel a = level("BUY SL", mtc::LevelKind::Position, 1.09, 8);
    a.id = "pos_7_sl";
    mtc::LevelList out = mtc::selectLevels({a, a}, 0.01, mtc::LevelSelectionConfig{});
    requireTrue(out.size() == 1, "same id once");
    requireTrue(mtc::levelDedupKey(a) == "pos_7_sl", "id is the key");
    std::printf("  Test 3 (identity dedup): PASS\n");
  }

  // ---- Test 4: positions and orders filtered to the symbol ----
  {
    mtc::LevelCompositor comp;
    comp.setSymbol("EURUSD");

    mtc::Position mine;
    mine.id = "7";
    mine.symbol = "eurusd";
    mine.type = "BUY";
    mine.entryPrice = 1.10;
    mine.stopLoss = 1.09;
    mine.takeProfit = 1.12;
    mtc::Position other = mine;
    other.id = "8";
    other.symbol = "GBPUSD";
    comp.setPositions({mine, other});

    mtc::Order ord;
    ord.id = "3";
    ord.symbol = "EURUSD";
    ord.side = "SELL";
    ord.type = "limit";
    ord.price = 1.115;
    comp.setOrders({ord});

    const mtc::LevelList& base = comp.baseLevels();
    requireTrue(base.size() == 4, "3 position levels + 1 order level");
    requireTrue(hasLabel(base, "BUY Entry") && hasLabel(base, "BUY SL") && hasLabel(base, "BUY TP"), "position labels");
    requireTrue(hasLabel(base, "LIMIT SELL"), "order label");

    mtc::LevelList drag = comp.draggableLevels();
    requireTrue(drag.size() == 3, "SL, TP and order price draggable");
    for (const auto& lv : drag) requireTrue(lv.label != "BUY Entry", "entry not draggable");
    const mtc::OverlayLevel* tp = nullptr;
    for (const auto& lv : drag) if (lv.id == "pos_7_tp") tp = &lv;
    requireTrue(tp && tp->meta.entity == mtc::LevelEntity::Position && tp->meta.field == mtc::LevelField::Tp,
                "tp meta");

    comp.setToggle(mtc::OverlayToggle::Positions, false);
    requireTrue(comp.baseLevels().size() == 1, "positions hidden");
    std::printf("  Test 4 (positions/orders): PASS\n");
  }

  // ---- Test 5: quote and min-stop constraint levels ----
  {
    mtc::LevelCompositor comp;
    comp.setSymbol("EURUSD");
    comp.setQuotePrice(1.1);
    comp.setMinStopDistance(0.002);
    requireTrue(comp.baseLevels().size() == 3, "last + two constraint levels");
    requireTrue(hasLabel(comp.baseLevels(), "Last"), "last");
    requireTrue(hasLabel(comp.baseLevels(), "MinStop+"), "min stop above");
    comp.setToggle(mtc::OverlayToggle::Constraints, false);
    requireTrue(comp.baseLevels().size() == 1, "constraints hidden");
    comp.clearQuote();
    requireTrue(comp.baseLevels().empty(), "no quote, no levels");
    std::printf("  Test 5 (quote levels): PASS\n");
  }

  // ---- Test 6: setups: latest per watcher, two most recent, invalidated dropped ----
  {
    mtc::LevelCompositor comp;
    comp.setSymbol("EURUSD");
    auto signal = [](const std::string& watcher, std::int64_t ts, const std::string& status, double entry) {
      mtc::SetupSignal s;
      s.symbol = "EUR/USD";
      s.timeframe = "15m";
      s.watcherId = watcher;
      s.strategy = "range_fade";
      s.ts = ts;
      s.status = status;
      s.entryPrice = entry;
      s.hasEntry = true;
      return s;
    };
    comp.setSetupSignals({
      signal("a", 1, "setup_detected", 1.1),
      signal("a", 5, "setup_ready", 1.2),
      signal("b", 4, "setup_ready", 1.3),
      signal("c", 3, "setup_ready", 1.4),
      signal("d", 9, "invalidated", 1.5),
    });
    mtc::LevelList out = comp.setupLevels(f15);
    requireTrue(out.size() == 2, "two watchers");
    requireTrue(out[0].label == "Setup range fade READY entry", "label format");
    requireTrue(out[0].price == 1.2, "latest of watcher a");
    requireTrue(out[1].price == 1.3, "then watcher b");
    requireTrue(comp.setupLevels(*mtc::findFramePreset("1H")).empty(), "other timeframe filtered");

    // Newest signal invalidated: the older ready one must not come back.
    comp.setSetupSignals({
      signal("e", 1, "setup_ready", 1.2),
      signal("e", 5, "invalidated", 1.2),
    });
    requireTrue(comp.setupLevels(f15).empty(), "watcher hidden after invalidation");
    std::printf("  Test 6 (setups): PASS\n");
  }

  // ---- Test 7: patterns inside the visible window ----
  {
    mtc::LevelCompositor comp;
    comp.setSymbol("EURUSD");
    mtc::CandleSeries visible = rampBars(10, 900000, 900000, 1.1, 0.0005);

    mtc::PatternEvent fvg;
    fvg.symbol = "EURUSD";
    fvg.timeframe = "15m";
    fvg.type = "fvg_bull";
    fvg.ts = visible[5].t;
    fvg.payload = {{"gapHigh", 1.103}, {"gapLow", 1.102}};
    mtc::PatternEvent old = fvg;
    old.type = "swing_high";
    old.ts = 1;
    old.payload = {{"price", 1.2}};
    comp.setPatternEvents({fvg, old});

    mtc::LevelList out = comp.patternLevels(f15, visible);
    requireTrue(out.size() == 2, "FVG high and low only");
    requireTrue(hasLabel(out, "FVG High") && hasLabel(out, "FVG Low"), "labels");
    requireTrue(mtc::formatPatternLabel("range_breakout_bull") == "Range Breakout Bull", "label format");
    requireTrue(mtc::formatPatternLabel("") == "Pattern", "empty label");
    std::printf("  Test 7 (patterns): PASS\n");
  }

  // ---- Test 8: finalize adds range and close fallback, keeps drag preview ----
  {
    mtc::LevelCompositor comp;
    comp.setSymbol("EURUSD");
    mtc::CandleSeries visible = rampBars(30, 0, 900000, 1.1, 0.0005);

    mtc::OverlayLevel preview = level("BUY TP", mtc::LevelKind::Drag, 1.12, 30);
    mtc::LevelList out = comp.finalize(comp.pricedLevels(f15, visible), visible, {}, &preview, 0.05);
    requireTrue(hasLabel(out, "Range H") && hasLabel(out, "Range L"), "range levels");
    requireTrue(hasLabel(out, "Close"), "close fallback without a quote");
    requireTrue(out[0].kind == mtc::LevelKind::Drag, "forced first");

    // A preview of an id'd level survives next to the level it was made from.
    mtc::OverlayLevel held = level("BUY TP", mtc::LevelKind::Position, 1.11, 25);
    held.id = "pos_7_tp";
    mtc::OverlayLevel moving = held;
    moving.id = "drag_pos_7_tp";
    moving.kind = mtc::LevelKind::Drag;
    moving.price = 1.105;
    out = comp.finalize({held}, visible, {}, &moving, 0.05);
    int drags = 0;
    bool heldKept = false;
    for (const auto& lv : out) {
      if (lv.kind == mtc::LevelKind::Drag) ++drags;
      if (lv.id == "pos_7_tp") heldKept = true;
    }
    requireTrue(drags == 1, "drag preview kept");
    requireTrue(heldKept, "held level kept");

    comp.setQuotePrice(1.115);
    out = comp.finalize(comp.pricedLevels(f15, visible), visible, {}, nullptr, 0.05);
    requireTrue(hasLabel(out, "Last") && !hasLabel(out, "Close"), "last replaces close");
    std::printf("  Test 8 (finalize): PASS\n");
  }

  // ---- Test 9: session table ----
  {
    const std::int64_t H = 3600000;
    requireTrue(mtc::sessionStyleForTs(2 * H)->id == "asia", "asia");
    requireTrue(mtc::sessionStyleForTs(8 * H)->id == "london", "london");
    requireTrue(mtc::sessionStyleForTs(14 * H)->id == "ny", "new york");
    requireTrue(mtc::sessionStyleForTs(22 * H) == nullptr, "off session");

    mtc::CandleSeries bars = rampBars(24, 0, H, 1.1, 0.0001);
    auto blocks = mtc::buildSessionBlocks(bars);
    requireTrue(blocks.size() == 3, "three blocks in a day");
    requireTrue(blocks[0].startIndex == 0 && blocks[0].endIndex == 6, "asia 0..6");
    requireTrue(blocks[2].endIndex == 20, "new york ends at 20");
    std::printf("  Test 9 (sessions): PASS\n");
  }

  // ---- Test 10: toggle names ----
  {
    mtc::OverlayToggle t;
    requireTrue(mtc::parseOverlayToggle("liveQuote", t) && t == mtc::OverlayToggle::LiveQuote, "liveQuote");
    requireTrue(!mtc::parseOverlayToggle("volume", t), "unknown");
    mtc::OverlayToggles toggles;
    requireTrue(!toggles.set(mtc::OverlayToggle::Ranges, true), "already on");
    requireTrue(toggles.set(mtc::OverlayToggle::Ranges, false) && !toggles.ranges, "turned off");
    std::printf("  Test 10 (toggles): PASS\n");
  }

  std::printf("D5.1 level_compositor: ALL PASS\n");
  return 0;
}
