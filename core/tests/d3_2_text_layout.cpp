// D3.2 — Text: width estimate, glyph atlas, layout, CPU raster

#include "mtc/render/Image.hpp"
#include "mtc/text/GlyphAtlas.hpp"
#include "mtc/text/TextLayout.hpp"
#include "mtc/text/TextRaster.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.4f expected %.4f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: no font ----
  {
    mtc::GlyphAtlas atlas;
    requireTrue(!atlas.fontLoaded(), "starts empty");
    requireTrue(!atlas.loadFontFile("/nonexistent/font.ttf"), "missing font file");
    requireClose(mtc::estimateTextWidth("1.1050", 10), 36, 1e-6, "estimate");
    mtc::TextMeasureFn measure = mtc::makeTextMeasure(&atlas);
    requireClose(measure("Last", 10), 24, 1e-6, "falls back to the estimate");

    mtc::Image img;
    img.resize(32, 16, mtc::Color{0, 0, 0, 1});
    requireClose(mtc::rasterText(img, atlas, "A", 2, 12, 12, mtc::Color{1, 1, 1, 1}), 0, 0,
                 "nothing drawn");
    requireTrue(img.pixel(8, 8)[0] == 0, "image untouched");
    std::printf("  Test 1 (no font): PASS\n");
  }

#ifndef FONT_PATH
  std::printf("D3.2 text_layout: font tests SKIPPED (no FONT_PATH)\n");
  return 0;
#else
  mtc::GlyphAtlas atlas;
  atlas.setAtlasSize(512);
  atlas.setGlyphPx(32);
  requireTrue(atlas.loadFontFile(FONT_PATH), "font loaded");
  requireTrue(atlas.ensureAscii(), "ascii rasterized");
  requireTrue(atlas.isDirty(), "dirty after packing");
  requireTrue(!atlas.ensureAscii(), "second pass packs nothing");

  // ---- Test 2: glyph metrics ----
  {
    const mtc::GlyphInfo* g = atlas.getGlyph('A');
    requireTrue(g != nullptr, "glyph A");
    requireTrue(g->advance > 0 && g->w > 0 && g->h > 0, "A metrics");
    requireTrue(g->u1 > g->u0 && g->v1 > g->v0, "top-down UVs");
    const mtc::GlyphInfo* space = atlas.getGlyph(' ');
    requireTrue(space != nullptr && space->advance > 0, "space advances");
    std::printf("  Test 2 (glyphs): PASS\n");
  }

  // ---- Test 3: layout ----
  {
    mtc::TextLayoutResult r = mtc::layoutText(atlas, "BUY TP", 10, 20, 16);
    requireTrue(r.glyphCount == 5, "space has no quad");
    requireTrue(r.glyphInstances.size() == 5 * 8, "glyph8 instances");
    requireClose(r.advanceWidth, mtc::measureText(atlas, "BUY TP", 16), 1e-4, "advance matches measure");
    requireClose(mtc::measureText(atlas, "BUY TP", 32), 2 * mtc::measureText(atlas, "BUY TP", 16), 1e-3,
                 "scales with size");
    requireTrue(r.glyphInstances[1] < 20 && r.glyphInstances[3] <= 21, "glyph above the baseline");
    mtc::TextMeasureFn measure = mtc::makeTextMeasure(&atlas);
    requireClose(measure("BUY TP", 16), r.advanceWidth, 1e-4, "measure uses the atlas");
    std::printf("  Test 3 (layout): PASS\n");
  }

  // ---- Test 4: CPU raster ----
  {
    mtc::Image img;
    img.resize(64, 32, mtc::Color{0, 0, 0, 1});
    float adv = mtc::rasterText(img, atlas, "HH", 4, 24, 20, mtc::Color{1, 1, 1, 1});
    requireTrue(adv > 0, "advanced");
    int lit = 0;
    for (int y = 0; y < img.height; y++) {
      for (int x = 0; x < img.width; x++) {
        if (img.pixel(x, y)[0] > 128) lit++;
      }
    }
    requireTrue(lit > 20, "glyph pixels drawn");
    std::printf("  Test 4 (raster): PASS\n");
  }

  std::printf("D3.2 text_layout: ALL PASS\n");
  return 0;
#endif
}
