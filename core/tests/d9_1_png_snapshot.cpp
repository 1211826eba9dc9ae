// D9.1 — PNG encoding and snapshot composition

#include "mtc/export/PngWriter.hpp"
#include "mtc/export/SnapshotComposer.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static std::uint32_t be32(const std::vector<std::uint8_t>& b, std::size_t off) {
  return (static_cast<std::uint32_t>(b[off]) << 24) | (static_cast<std::uint32_t>(b[off + 1]) << 16) |
         (static_cast<std::uint32_t>(b[off + 2]) << 8) | static_cast<std::uint32_t>(b[off + 3]);
}

static mtc::Image solid(int w, int h, const mtc::Color& c) {
  mtc::Image img;
  img.resize(w, h, c);
  return img;
}

int main() {
  // ---- Test 1: signature, IHDR, IDAT, IEND ----
  {
    mtc::Image img = solid(2, 2, mtc::Color{1, 0, 0, 1});
    std::vector<std::uint8_t> png = mtc::encodePNG(img);
    const std::uint8_t sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    requireTrue(png.size() > 8 && std::memcmp(png.data(), sig, 8) == 0, "signature");

    requireTrue(be32(png, 8) == 13, "IHDR length");
    requireTrue(std::memcmp(&png[12], "IHDR", 4) == 0, "IHDR type");
    requireTrue(be32(png, 16) == 2 && be32(png, 20) == 2, "dimensions");
    requireTrue(png[24] == 8 && png[25] == 2, "8-bit RGB");

    std::size_t idat = 8 + 12 + 13;
    requireTrue(std::memcmp(&png[idat + 4], "IDAT", 4) == 0, "IDAT follows");
    // zlib header + one stored block of 2 rows x (filter + 6 bytes) + adler
    requireTrue(be32(png, idat) == 2 + 5 + 14 + 4, "IDAT length");
    requireTrue(png[idat + 8] == 0x78, "zlib header");
    // First pixel: filter byte then R,G,B
    requireTrue(png[idat + 8 + 7] == 0 && png[idat + 8 + 8] == 255 && png[idat + 8 + 9] == 0,
                "red pixel");

    std::size_t n = png.size();
    requireTrue(std::memcmp(&png[n - 8], "IEND", 4) == 0, "IEND last");
    requireTrue(png[n - 4] == 0xAE && png[n - 3] == 0x42 && png[n - 2] == 0x60 && png[n - 1] == 0x82,
                "IEND crc");
    std::printf("  Test 1 (png layout): PASS\n");
  }

  // ---- Test 2: flipped rows ----
  {
    std::vector<std::uint8_t> rgba = {
      0, 0, 255, 255,      // row 0 blue
      0, 255, 0, 255,      // row 1 green
    };
    std::vector<std::uint8_t> top = mtc::encodePNG(rgba.data(), 1, 2, false);
    std::vector<std::uint8_t> flip = mtc::encodePNG(rgba.data(), 1, 2, true);
    std::size_t px = 8 + 12 + 13 + 8 + 2 + 5 + 1;
    requireTrue(top[px + 2] == 255, "top-down starts blue");
    requireTrue(flip[px + 1] == 255, "flipped starts green");
    requireTrue(mtc::encodePNG(nullptr, 0, 0).empty(), "nothing to encode");
    std::printf("  Test 2 (row order): PASS\n");
  }

  // ---- Test 3: composer needs data ----
  {
    mtc::SnapshotComposer composer;
    mtc::Image out = solid(3, 3, mtc::Color{0, 0, 0, 1});
    requireTrue(!composer.compose("EURUSD", {}, 0, out), "no entries");

    mtc::Image canvas = solid(40, 20, mtc::Color{0, 1, 0, 1});
    mtc::SnapshotEntry noBars{"5m", 0, 0, &canvas};
    mtc::SnapshotEntry noImage{"15m", 100, 0, nullptr};
    requireTrue(!composer.compose("EURUSD", {noBars, noImage}, 0, out), "nothing capturable");
    requireTrue(out.width == 3 && out.height == 3, "output untouched");
    std::printf("  Test 3 (empty capture): PASS\n");
  }

  // ---- Test 4: stacked layout ----
  {
    mtc::SnapshotComposer composer;
    mtc::Image a = solid(100, 50, mtc::Color{1, 0, 0, 1});
    mtc::Image b = solid(80, 30, mtc::Color{0, 0, 1, 1});
    mtc::Image skipped = solid(200, 90, mtc::Color{1, 1, 1, 1});
    std::vector<mtc::SnapshotEntry> entries = {
      {"5m", 120, 1700000000000LL, &a},
      {"1W", 0, 0, &skipped},
      {"1H", 60, 1700000000000LL, &b},
    };
    mtc::Image out;
    requireTrue(composer.compose("EURUSD", entries, 1700000012000LL, out), "composed");
    requireTrue(out.width == 100 + 2 * 10, "widest canvas plus side padding");
    requireTrue(out.height == 28 + (18 + 50) + (18 + 30) + 12 + 6, "stacked height");
    requireTrue(out.height == composer.composedHeight({50, 30}), "composedHeight agrees");

    const std::uint8_t* red = out.pixel(60, 28 + 18 + 10);
    requireTrue(red[0] == 255 && red[2] == 0, "first canvas");
    const std::uint8_t* blue = out.pixel(60, 28 + 18 + 50 + 12 + 18 + 5);
    requireTrue(blue[2] == 255 && blue[0] == 0, "second canvas");

    requireTrue(mtc::snapshotTitle("EURUSD") == "Native Chart EURUSD", "title");
    requireTrue(mtc::snapshotFrameLine(entries[0], 1700000012000LL) == "5m | 120 bars | updated 12s",
                "frame line");
    std::printf("  Test 4 (composition): PASS\n");
  }

  std::printf("D9.1 png_snapshot: ALL PASS\n");
  return 0;
}
