// D1.1 — Resolution table, bucket math, timeframe and symbol keys

#include "mtc/data/Resolution.hpp"
#include "mtc/data/Symbols.hpp"
#include "mtc/frames/FrameConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: durations ----
  {
    requireTrue(mtc::resolutionMs("1m") == 60000, "1m");
    requireTrue(mtc::resolutionMs("5m") == 300000, "5m");
    requireTrue(mtc::resolutionMs("4H") == 14400000, "4H");
    requireTrue(mtc::resolutionMs("1W") == 604800000, "1W");
    requireTrue(mtc::resolutionMs("1h") == 3600000, "loose 1h");
    requireTrue(mtc::resolutionMs("2m") == 0, "unknown is 0");
    requireTrue(mtc::canonicalIndex("1m") == 0, "1m first");
    requireTrue(mtc::canonicalIndex("1W") == mtc::kResolutionCount - 1, "1W last");
    std::printf("  Test 1 (durations): PASS\n");
  }

  // ---- Test 2: bucket start ----
  {
    requireTrue(mtc::bucketStart(90000, 60000) == 60000, "90000 -> 60000");
    requireTrue(mtc::bucketStart(125000, 60000) == 120000, "125000 -> 120000");
    requireTrue(mtc::bucketStart(60000, 60000) == 60000, "exact boundary");
    requireTrue(mtc::bucketStart(-1, 60000) == -60000, "floors negatives");
    std::printf("  Test 2 (bucket start): PASS\n");
  }

  // ---- Test 3: timeframe keys ----
  {
    requireTrue(mtc::normalizeTimeframeKey("1h") == "1H", "1h");
    requireTrue(mtc::normalizeTimeframeKey("15 m") == "15m", "15 m");
    requireTrue(mtc::normalizeTimeframeKey(" 1d ") == "1D", "1d");
    requireTrue(mtc::normalizeTimeframeKey("daily") == "daily", "unmatched trimmed");
    requireTrue(mtc::resolveFrameId("4h") == "4H", "resolve 4h");
    requireTrue(mtc::resolveFrameId("15 M") == "15m", "resolve 15 M");
    requireTrue(mtc::resolveFrameId("2h").empty(), "unknown frame");
    std::printf("  Test 3 (timeframe keys): PASS\n");
  }

  // ---- Test 4: presets ----
  {
    const auto& presets = mtc::framePresets();
    requireTrue(presets.size() == 8, "8 presets");
    for (std::size_t i = 1; i < presets.size(); i++) {
      requireTrue(mtc::canonicalIndex(presets[i - 1].id) < mtc::canonicalIndex(presets[i].id),
                  "canonical order");
    }
    const mtc::FrameConfig* f = mtc::findFramePreset("5m");
    requireTrue(f != nullptr, "5m preset");
    requireTrue(f->capacity() == static_cast<std::size_t>(f->lookbackBars), "capacity is lookback");
    auto defaults = mtc::defaultActiveFrameIds();
    requireTrue(defaults.size() == 4 && defaults[0] == "5m" && defaults[3] == "4H", "defaults");
    std::printf("  Test 4 (presets): PASS\n");
  }

  // ---- Test 5: symbol keys ----
  {
    requireTrue(mtc::normalizeSymbolKey("oanda:eur_usd.pro ") == "EUR_USD", "prefix/suffix stripped");
    requireTrue(mtc::normalizeSymbolLoose("EUR/USD") == "EURUSD", "loose drops slash");
    requireTrue(mtc::normalizeSymbolLoose("eur_usd") == "EURUSD", "loose drops underscore");
    requireTrue(mtc::normalizeSymbolKey("").empty(), "empty");
    std::printf("  Test 5 (symbol keys): PASS\n");
  }

  std::printf("D1.1 resolution: ALL PASS\n");
  return 0;
}
