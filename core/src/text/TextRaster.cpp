#include "mtc/text/TextRaster.hpp"
#include "mtc/text/TextLayout.hpp"

#include <algorithm>
#include <cmath>

namespace mtc {

namespace {

float sampleAtlas(const GlyphAtlas& atlas, float ax, float ay) {
  const std::uint8_t* data = atlas.atlasData();
  int size = static_cast<int>(atlas.atlasSize());
  ax -= 0.5f;
  ay -= 0.5f;
  int x0 = static_cast<int>(std::floor(ax));
  int y0 = static_cast<int>(std::floor(ay));
  float fx = ax - static_cast<float>(x0);
  float fy = ay - static_cast<float>(y0);
  auto at = [&](int x, int y) -> float {
    if (x < 0 || y < 0 || x >= size || y >= size) return 0.0f;
    return static_cast<float>(data[static_cast<std::size_t>(y) * size + x]) / 255.0f;
  };
  float top = at(x0, y0) * (1 - fx) + at(x0 + 1, y0) * fx;
  float bot = at(x0, y0 + 1) * (1 - fx) + at(x0 + 1, y0 + 1) * fx;
  return top * (1 - fy) + bot * fy;
}

} // namespace

float rasterText(Image& img, const GlyphAtlas& atlas, const std::string& text,
                 float x, float baselineY, float fontPx, const Color& color) {
  if (!atlas.fontLoaded() || img.empty()) return 0.0f;

  float scale = fontPx / static_cast<float>(atlas.glyphPx());
  float inv = 1.0f / scale;
  float cursorX = x;

  for (unsigned char ch : text) {
    const GlyphInfo* g = atlas.getGlyph(ch);
    if (!g) continue;
    if (g->w > 0 && g->h > 0) {
      float gx0 = cursorX + g->bearingX * scale;
      float gy0 = baselineY - g->bearingY * scale;
      int px0 = static_cast<int>(std::floor(gx0));
      int py0 = static_cast<int>(std::floor(gy0));
      int px1 = static_cast<int>(std::ceil(gx0 + g->w * scale));
      int py1 = static_cast<int>(std::ceil(gy0 + g->h * scale));
      for (int py = py0; py < py1; py++) {
        for (int px = px0; px < px1; px++) {
          float lx = (static_cast<float>(px) + 0.5f - gx0) * inv;
          float ly = (static_cast<float>(py) + 0.5f - gy0) * inv;
          if (lx < 0 || ly < 0 || lx > g->w || ly > g->h) continue;
          float a = sampleAtlas(atlas, static_cast<float>(g->ax) + lx,
                                static_cast<float>(g->ay) + ly);
          if (atlas.useSdf()) {
            float t = std::max(0.0f, std::min(1.0f, (a - 0.45f) / 0.1f));
            a = t * t * (3.0f - 2.0f * t);
          }
          img.blendPixel(px, py, color, a);
        }
      }
    }
    cursorX += g->advance * scale;
  }
  return cursorX - x;
}

} // namespace mtc
