// D1.2 — Bar normalization: field aliases, epoch seconds, malformed records

#include "mtc/data/BarNormalizer.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.8f expected %.8f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: short keys, ms timestamps ----
  {
    mtc::NormalizeResult r;
    bool ok = mtc::normalizeBarsJson(
        R"([{"t":1700000060000,"o":1.1,"h":1.2,"l":1.0,"c":1.15,"v":10}])", r);
    requireTrue(ok, "parses");
    requireTrue(r.bars.size() == 1, "one bar");
    requireTrue(r.bars[0].t == 1700000060000LL, "t kept as ms");
    requireClose(r.bars[0].h, 1.2, 1e-12, "high");
    requireTrue(r.bars[0].hasVolume, "volume present");
    std::printf("  Test 1 (short keys): PASS\n");
  }

  // ---- Test 2: long keys, seconds, numeric strings ----
  {
    mtc::NormalizeResult r;
    bool ok = mtc::normalizeBarsJson(
        R"({"bars":[{"time":1700000000,"open":"1,234.5","high":"1,240","low":1230,"close":"1235.25"}]})", r);
    requireTrue(ok, "object with bars");
    requireTrue(r.bars.size() == 1, "one bar");
    requireTrue(r.bars[0].t == 1700000000000LL, "seconds scaled");
    requireClose(r.bars[0].o, 1234.5, 1e-9, "thousands separator");
    requireClose(r.bars[0].c, 1235.25, 1e-9, "close");
    requireTrue(!r.bars[0].hasVolume, "no volume");
    std::printf("  Test 2 (long keys, seconds): PASS\n");
  }

  // ---- Test 3: missing high/low derived, close-only bar ----
  {
    mtc::NormalizeResult r;
    mtc::normalizeBarsJson(R"([{"timestamp":1700000000000,"c":2.5}])", r);
    requireTrue(r.bars.size() == 1, "close-only accepted");
    requireClose(r.bars[0].o, 2.5, 1e-12, "open from close");
    requireClose(r.bars[0].h, 2.5, 1e-12, "high from open");
    requireClose(r.bars[0].l, 2.5, 1e-12, "low from open");
    std::printf("  Test 3 (derived fields): PASS\n");
  }

  // ---- Test 4: malformed records dropped, rest kept ----
  {
    mtc::NormalizeResult r;
    bool ok = mtc::normalizeBarsJson(
        R"([{"t":1700000120000,"o":1,"c":1},
            {"o":1,"c":1},
            {"t":"abc","o":1,"c":1},
            {"t":1700000060000,"h":2},
            42,
            {"t":1700000060000,"o":1.5,"c":1.6}])", r);
    requireTrue(ok, "array parses");
    requireTrue(r.dropped == 4, "four dropped");
    requireTrue(r.bars.size() == 2, "two kept");
    requireTrue(r.bars[0].t < r.bars[1].t, "sorted ascending");
    std::printf("  Test 4 (malformed dropped): PASS\n");
  }

  // ---- Test 5: duplicate timestamps keep the last record ----
  {
    mtc::NormalizeResult r;
    mtc::normalizeBarsJson(
        R"([{"t":1700000060000,"o":1,"c":1},{"t":1700000060000,"o":2,"c":2}])", r);
    requireTrue(r.bars.size() == 1, "deduplicated");
    requireClose(r.bars[0].c, 2, 1e-12, "last wins");
    std::printf("  Test 5 (duplicates): PASS\n");
  }

  // ---- Test 6: parse errors ----
  {
    mtc::NormalizeResult r;
    requireTrue(!mtc::normalizeBarsJson("[{", r), "truncated JSON rejected");
    requireTrue(r.bars.empty(), "empty output");
    requireTrue(!mtc::normalizeBarsJson(R"({"x":1})", r), "object without bars rejected");
    requireTrue(mtc::normalizeBarsJson("[]", r) && r.bars.empty(), "empty array ok");
    std::printf("  Test 6 (parse errors): PASS\n");
  }

  std::printf("D1.2 bar_normalizer: ALL PASS\n");
  return 0;
}
