// D8.1 — Level tag placement: spacing, bounds, input order

#include "mtc/render/LabelPlacer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.4f expected %.4f)\n", msg, a, b);
    std::exit(1);
  }
}

static void requireSpaced(std::vector<double> ys, double minSpacing) {
  std::sort(ys.begin(), ys.end());
  for (std::size_t i = 1; i < ys.size(); i++) {
    requireTrue(ys[i] - ys[i - 1] >= minSpacing - 1e-9, "tags keep the minimum spacing");
  }
}

int main() {
  // ---- Test 1: spread tags stay where they are ----
  {
    std::vector<double> out = mtc::placeLabels({50, 120, 200}, 10, 300, 12);
    requireClose(out[0], 50, 1e-9, "first");
    requireClose(out[1], 120, 1e-9, "second");
    requireClose(out[2], 200, 1e-9, "third");
    std::printf("  Test 1 (no overlap): PASS\n");
  }

  // ---- Test 2: a cluster is pushed down, input order kept ----
  {
    std::vector<double> out = mtc::placeLabels({104, 100, 102}, 10, 300, 12);
    requireClose(out[1], 100, 1e-9, "topmost keeps its place");
    requireClose(out[2], 112, 1e-9, "next pushed");
    requireClose(out[0], 124, 1e-9, "last pushed");
    requireSpaced(out, 12);
    std::printf("  Test 2 (cluster): PASS\n");
  }

  // ---- Test 3: clamped into bounds, tail pulled back up ----
  {
    std::vector<double> out = mtc::placeLabels({-40, 295, 298, 400}, 10, 300, 12);
    for (double y : out) requireTrue(y >= 10 && y <= 300, "inside bounds");
    requireClose(out[0], 10, 1e-9, "clamped to top");
    requireClose(out[3], 300, 1e-9, "last at the bottom");
    requireSpaced(out, 12);
    std::printf("  Test 3 (bounds): PASS\n");
  }

  // ---- Test 4: overfull column restacks from the top ----
  {
    std::vector<double> desired(10, 50);
    std::vector<double> out = mtc::placeLabels(desired, 10, 60, 12);
    double lo = *std::min_element(out.begin(), out.end());
    requireClose(lo, 10, 1e-9, "top wins");
    requireSpaced(out, 12);
    std::printf("  Test 4 (overfull): PASS\n");
  }

  // ---- Test 5: plot insets ----
  {
    mtc::LabelPlacerConfig cfg;
    std::vector<double> out = mtc::placeLevelTags({0, 1000}, 18, 360, cfg);
    requireClose(out[0], 18 + cfg.topInset, 1e-9, "top inset");
    requireClose(out[1], 18 + 360 - cfg.bottomInset, 1e-9, "bottom inset");
    requireTrue(mtc::placeLabels({}, 0, 10, 12).empty(), "empty in, empty out");
    std::printf("  Test 5 (insets): PASS\n");
  }

  std::printf("D8.1 label_placer: ALL PASS\n");
  return 0;
}
