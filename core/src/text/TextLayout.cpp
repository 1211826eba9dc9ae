#include "mtc/text/TextLayout.hpp"

#include <initializer_list>

namespace mtc {

TextLayoutResult layoutText(const GlyphAtlas& atlas, const std::string& text,
                            float x, float baselineY, float fontPx) {
  TextLayoutResult r;
  float scale = fontPx / static_cast<float>(atlas.glyphPx());
  float cursorX = x;

  for (unsigned char ch : text) {
    const GlyphInfo* g = atlas.getGlyph(ch);
    if (!g) continue;
    if (g->w > 0 && g->h > 0) {
      float x0 = cursorX + g->bearingX * scale;
      float y0 = baselineY - g->bearingY * scale;
      r.glyphInstances.insert(r.glyphInstances.end(), {
        x0, y0, x0 + g->w * scale, y0 + g->h * scale,
        g->u0, g->v0, g->u1, g->v1});
      r.glyphCount++;
    }
    cursorX += g->advance * scale;
  }
  r.advanceWidth = cursorX - x;
  return r;
}

float measureText(const GlyphAtlas& atlas, const std::string& text, float fontPx) {
  float scale = fontPx / static_cast<float>(atlas.glyphPx());
  float w = 0;
  for (unsigned char ch : text) {
    const GlyphInfo* g = atlas.getGlyph(ch);
    if (g) w += g->advance * scale;
  }
  return w;
}

TextMeasureFn makeTextMeasure(const GlyphAtlas* atlas) {
  return [atlas](const std::string& text, float fontPx) {
    if (atlas && atlas->fontLoaded()) return measureText(*atlas, text, fontPx);
    return estimateTextWidth(text, fontPx);
  };
}

} // namespace mtc
