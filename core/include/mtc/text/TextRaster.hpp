#pragma once
#include "mtc/render/Image.hpp"
#include "mtc/style/Theme.hpp"
#include "mtc/text/GlyphAtlas.hpp"

#include <string>

namespace mtc {

// CPU text: samples the atlas (bilinear) into img with source-over
// blending. Returns the advance width; draws nothing without a font.
float rasterText(Image& img, const GlyphAtlas& atlas, const std::string& text,
                 float x, float baselineY, float fontPx, const Color& color);

} // namespace mtc
