// D10.1 — Engine configuration: JSON overrides, validation, round trip

#include "mtc/engine/EngineConfig.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: defaults ----
  {
    mtc::EngineConfig cfg;
    requireClose(cfg.hitTolerancePx, 6, 0, "hit tolerance");
    requireClose(cfg.dedupBandFraction, 0.003, 0, "dedup band");
    requireClose(cfg.dragConfirmPx, 2, 0, "drag confirm");
    requireTrue(cfg.maxSelectedLevels == 6, "max selected");
    requireTrue(cfg.refreshIntervalMs == 15000, "refresh interval");
    requireTrue(cfg.maxActiveFrames == 5, "max frames");
    requireTrue(cfg.quoteRepeatWindowMs == 1000 && cfg.quoteMinIntervalMs == 200, "quote gates");
    requireTrue(cfg.activeFrames.empty(), "default frame set");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // ---- Test 2: overrides ----
  {
    mtc::EngineConfig cfg;
    bool ok = mtc::loadEngineConfig(R"({
      "hitTolerancePx": 8,
      "maxSelectedLevels": 4,
      "refreshIntervalMs": 30000,
      "refreshJitter": 0.2,
      "brokerLabel": "MT5",
      "activeFrames": ["1m", "1H"]
    })", cfg);
    requireTrue(ok, "parsed");
    requireClose(cfg.hitTolerancePx, 8, 0, "hit tolerance");
    requireTrue(cfg.maxSelectedLevels == 4, "max selected");
    requireTrue(cfg.refreshIntervalMs == 30000, "interval");
    requireClose(cfg.refreshJitter, 0.2, 1e-12, "jitter");
    requireTrue(cfg.brokerLabel == "MT5", "broker");
    requireTrue(cfg.activeFrames.size() == 2 && cfg.activeFrames[1] == "1H", "frames");
    requireClose(cfg.dragConfirmPx, 2, 0, "untouched field");
    std::printf("  Test 2 (overrides): PASS\n");
  }

  // ---- Test 3: invalid fields skipped one by one ----
  {
    mtc::EngineConfig cfg;
    bool ok = mtc::loadEngineConfig(R"({
      "hitTolerancePx": -1,
      "dedupBandFraction": 1.5,
      "refreshJitter": 0.9,
      "maxActiveFrames": 0,
      "maxSelectedLevels": "many",
      "brokerLabel": "",
      "activeFrames": "5m",
      "quoteMinIntervalMs": 0
    })", cfg);
    requireTrue(ok, "still an object");
    requireClose(cfg.hitTolerancePx, 6, 0, "negative skipped");
    requireClose(cfg.dedupBandFraction, 0.003, 0, "out of range skipped");
    requireClose(cfg.refreshJitter, 0.08, 0, "jitter cap");
    requireTrue(cfg.maxActiveFrames == 5, "zero frames skipped");
    requireTrue(cfg.maxSelectedLevels == 6, "mistyped skipped");
    requireTrue(cfg.brokerLabel == "broker", "empty label skipped");
    requireTrue(cfg.activeFrames.empty(), "non-array skipped");
    requireTrue(cfg.quoteMinIntervalMs == 0, "zero interval allowed");
    std::printf("  Test 3 (validation): PASS\n");
  }

  // ---- Test 4: not an object ----
  {
    mtc::EngineConfig cfg;
    requireTrue(!mtc::loadEngineConfig("[1,2]", cfg), "array");
    requireTrue(!mtc::loadEngineConfig("{bad", cfg), "parse error");
    requireTrue(!mtc::loadEngineConfigFile("/nonexistent/mtc.json", cfg), "missing file");
    std::printf("  Test 4 (rejects): PASS\n");
  }

  // ---- Test 5: serialize and load back ----
  {
    mtc::EngineConfig a;
    a.brokerLabel = "cTrader";
    a.refreshIntervalMs = 20000;
    a.activeFrames = {"15m", "4H", "1D"};
    std::string json = mtc::engineConfigToJson(a);
    mtc::EngineConfig b;
    requireTrue(mtc::loadEngineConfig(json, b), "reloaded");
    requireTrue(b.brokerLabel == "cTrader", "broker");
    requireTrue(b.refreshIntervalMs == 20000, "interval");
    requireTrue(b.activeFrames == a.activeFrames, "frames");
    std::printf("  Test 5 (serialize): PASS\n");
  }

  std::printf("D10.1 engine_config: ALL PASS\n");
  return 0;
}
