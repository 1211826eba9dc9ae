#pragma once
#include "mtc/text/GlyphAtlas.hpp"

#include <functional>
#include <string>
#include <vector>

namespace mtc {

// Pixel space, y down. One glyph8 instance per visible glyph:
// x0,y0 (top-left), x1,y1 (bottom-right), u0,v0,u1,v1.
struct TextLayoutResult {
  std::vector<float> glyphInstances;
  int glyphCount{0};
  float advanceWidth{0};
};

TextLayoutResult layoutText(const GlyphAtlas& atlas, const std::string& text,
                            float x, float baselineY, float fontPx);

float measureText(const GlyphAtlas& atlas, const std::string& text, float fontPx);

// Monospace estimate used when no font is loaded.
inline float estimateTextWidth(const std::string& text, float fontPx) {
  return 0.6f * fontPx * static_cast<float>(text.size());
}

using TextMeasureFn = std::function<float(const std::string& text, float fontPx)>;

// Measures with the atlas when it has a font, else estimates. The atlas
// must outlive the returned function.
TextMeasureFn makeTextMeasure(const GlyphAtlas* atlas);

} // namespace mtc
