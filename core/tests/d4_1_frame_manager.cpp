// D4.1 — Frame manager: toggle bounds, eviction, wholesale replacement

#include "mtc/frames/FrameManager.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool sameIds(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  return a == b;
}

int main() {
  // ---- Test 1: defaults ----
  {
    mtc::FrameManager fm;
    requireTrue(sameIds(fm.activeIds(), {"5m", "15m", "1H", "4H"}), "default frames");
    for (const auto& id : fm.activeIds()) requireTrue(fm.state(id) != nullptr, "state exists");
    requireTrue(fm.activeConfigs().size() == 4, "configs");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // ---- Test 2: toggle honors the 1..5 bounds ----
  {
    mtc::FrameManager fm;
    requireTrue(fm.toggleFrame("1m"), "add 1m");
    requireTrue(sameIds(fm.activeIds(), {"1m", "5m", "15m", "1H", "4H"}), "canonical order");
    requireTrue(!fm.toggleFrame("1D"), "sixth refused");
    requireTrue(fm.activeIds().size() == 5, "still 5");

    for (const char* id : {"1m", "5m", "15m", "1H"}) requireTrue(fm.toggleFrame(id), "remove");
    requireTrue(sameIds(fm.activeIds(), {"4H"}), "one left");
    requireTrue(!fm.toggleFrame("4H"), "last frame stays");
    requireTrue(!fm.toggleFrame("3m"), "unknown ignored");
    std::printf("  Test 2 (toggle bounds): PASS\n");
  }

  // ---- Test 3: ensureFrameActive resolves and evicts the oldest ----
  {
    mtc::FrameManager fm;
    requireTrue(fm.ensureFrameActive("15 m"), "already active");
    requireTrue(fm.activeIds().size() == 4, "unchanged");

    requireTrue(fm.ensureFrameActive("1d"), "add 1D");
    requireTrue(fm.activeIds().size() == 5, "now full");

    requireTrue(fm.ensureFrameActive("1w"), "add 1W at capacity");
    requireTrue(sameIds(fm.activeIds(), {"15m", "1H", "4H", "1D", "1W"}), "oldest (5m) evicted");
    requireTrue(!fm.ensureFrameActive("7x"), "unresolvable");
    requireTrue(fm.activeIds().size() == 5, "no change on failure");
    std::printf("  Test 3 (ensure/evict): PASS\n");
  }

  // ---- Test 4: setActiveFrames ----
  {
    mtc::FrameManager fm;
    requireTrue(fm.setActiveFrames({"4h", "1m", "4H", "bogus", "1h"}), "changed");
    requireTrue(sameIds(fm.activeIds(), {"1m", "1H", "4H"}), "resolved, deduped, ordered");
    requireTrue(!fm.setActiveFrames({"nope"}), "nothing resolves: no-op");
    requireTrue(fm.activeIds().size() == 3, "kept");
    requireTrue(!fm.setActiveFrames({"1H", "1m", "4H"}), "same set: unchanged");
    requireTrue(fm.setActiveFrames({"1m", "5m", "15m", "30m", "1H", "4H", "1D"}), "capped");
    requireTrue(fm.activeIds().size() == 5, "at most 5");
    std::printf("  Test 4 (setActiveFrames): PASS\n");
  }

  // ---- Test 5: state survives deactivation until reset ----
  {
    mtc::FrameManager fm;
    mtc::Candle c;
    c.t = 1;
    fm.ensureState("5m").bars.push_back(c);
    fm.toggleFrame("5m");
    requireTrue(fm.state("5m") && fm.state("5m")->bars.size() == 1, "kept while inactive");
    fm.resetAll();
    requireTrue(fm.state("5m") == nullptr, "dropped on reset");
    requireTrue(fm.state("15m") != nullptr && fm.state("15m")->bars.empty(), "active frames fresh");
    std::printf("  Test 5 (state lifetime): PASS\n");
  }

  // ---- Test 6: smaller capacity ----
  {
    mtc::FrameManager fm;
    mtc::FrameManagerConfig cfg;
    cfg.maxActiveFrames = 2;
    fm.setConfig(cfg);
    requireTrue(fm.activeIds().size() == 2, "shrunk");
    requireTrue(!fm.toggleFrame("1D"), "full");
    std::printf("  Test 6 (capacity config): PASS\n");
  }

  std::printf("D4.1 frame_manager: ALL PASS\n");
  return 0;
}
