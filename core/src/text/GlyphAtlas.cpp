#include "mtc/text/GlyphAtlas.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace mtc {

GlyphAtlas::GlyphAtlas() {
  setAtlasSize(atlasSize_);
}

void GlyphAtlas::resetPacking() {
  atlas_.assign(static_cast<std::size_t>(atlasSize_) * atlasSize_, 0);
  shelves_.clear();
  shelves_.push_back({1, 1, 0});
  glyphs_.clear();
  dirty_ = true;
}

void GlyphAtlas::setAtlasSize(std::uint32_t s) {
  atlasSize_ = s;
  resetPacking();
}

void GlyphAtlas::setGlyphPx(std::uint32_t px) {
  if (px == glyphPx_) return;
  glyphPx_ = px;
  resetPacking();
}

void GlyphAtlas::setUseSdf(bool v) {
  if (v == useSdf_) return;
  useSdf_ = v;
  resetPacking();
}

bool GlyphAtlas::loadFont(const std::uint8_t* data, std::uint32_t len) {
  if (!data || len == 0) return false;
  stbtt_fontinfo probe;
  std::vector<std::uint8_t> bytes(data, data + len);
  if (!stbtt_InitFont(&probe, bytes.data(), stbtt_GetFontOffsetForIndex(bytes.data(), 0))) {
    std::fprintf(stderr, "GlyphAtlas::loadFont: not a TrueType font (%u bytes)\n", len);
    return false;
  }
  fontData_ = std::move(bytes);
  fontLoaded_ = true;
  resetPacking();
  return true;
}

bool GlyphAtlas::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "GlyphAtlas::loadFontFile: cannot open %s\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) return false;
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(bytes.data()), sz);
  if (!f) return false;
  return loadFont(bytes.data(), static_cast<std::uint32_t>(bytes.size()));
}

bool GlyphAtlas::ensureAscii() {
  std::vector<std::uint32_t> cp;
  for (std::uint32_t c = 32; c <= 126; c++) cp.push_back(c);
  return ensureGlyphs(cp.data(), static_cast<std::uint32_t>(cp.size()));
}

bool GlyphAtlas::ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count) {
  if (!fontLoaded_) return false;

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), stbtt_GetFontOffsetForIndex(fontData_.data(), 0))) {
    std::fprintf(stderr, "GlyphAtlas::ensureGlyphs: stbtt_InitFont failed\n");
    return false;
  }

  float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  float invAtlas = 1.0f / static_cast<float>(atlasSize_);
  bool modified = false;

  for (std::uint32_t i = 0; i < count; i++) {
    std::uint32_t cp = codepoints[i];
    if (glyphs_.find(cp) != glyphs_.end()) continue;

    int glyphIdx = stbtt_FindGlyphIndex(&font, static_cast<int>(cp));
    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&font, glyphIdx, &advW, &lsb);

    int ix0, iy0, ix1, iy1;
    stbtt_GetGlyphBitmapBox(&font, glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);
    int gw = ix1 - ix0;
    int gh = iy1 - iy0;

    GlyphInfo info;
    info.codepoint = cp;
    info.advance = static_cast<float>(advW) * scale;
    info.bearingX = static_cast<float>(ix0);
    info.bearingY = static_cast<float>(-iy0);

    if (gw <= 0 || gh <= 0) {
      glyphs_[cp] = info;   // whitespace
      continue;
    }

    std::vector<std::uint8_t> bitmap(static_cast<std::size_t>(gw) * gh, 0);
    stbtt_MakeGlyphBitmap(&font, bitmap.data(), gw, gh, gw, scale, scale, glyphIdx);

    auto w = static_cast<std::uint32_t>(gw);
    auto h = static_cast<std::uint32_t>(gh);
    if (useSdf_) {
      std::vector<std::uint8_t> sdf(bitmap.size());
      buildSdfR8(bitmap.data(), w, h, sdfRange_, sdf.data());
      bitmap.swap(sdf);
    }

    std::uint32_t ax, ay;
    if (!packGlyph(w + pad_ * 2, h + pad_ * 2, ax, ay)) {
      std::fprintf(stderr, "GlyphAtlas::ensureGlyphs: atlas full (cp=%u)\n", cp);
      continue;
    }
    ax += pad_;
    ay += pad_;
    for (std::uint32_t row = 0; row < h; row++) {
      std::memcpy(&atlas_[(ay + row) * atlasSize_ + ax], &bitmap[row * w], w);
    }

    info.ax = ax;
    info.ay = ay;
    info.w = static_cast<float>(gw);
    info.h = static_cast<float>(gh);
    info.u0 = static_cast<float>(ax) * invAtlas;
    info.u1 = static_cast<float>(ax + w) * invAtlas;
    info.v0 = static_cast<float>(ay) * invAtlas;
    info.v1 = static_cast<float>(ay + h) * invAtlas;
    glyphs_[cp] = info;
    modified = true;
  }

  if (modified) dirty_ = true;
  return modified;
}

const GlyphInfo* GlyphAtlas::getGlyph(std::uint32_t codepoint) const {
  auto it = glyphs_.find(codepoint);
  return it == glyphs_.end() ? nullptr : &it->second;
}

bool GlyphAtlas::packGlyph(std::uint32_t w, std::uint32_t h,
                           std::uint32_t& outX, std::uint32_t& outY) {
  for (auto& shelf : shelves_) {
    if (shelf.x + w > atlasSize_ - 1 || shelf.y + h > atlasSize_ - 1) continue;
    if (shelf.h == 0) shelf.h = h;
    if (h <= shelf.h) {
      outX = shelf.x;
      outY = shelf.y;
      shelf.x += w;
      return true;
    }
  }

  const Shelf& last = shelves_.back();
  std::uint32_t ny = last.y + last.h;
  if (ny + h > atlasSize_ - 1 || w > atlasSize_ - 2) return false;
  outX = 1;
  outY = ny;
  shelves_.push_back({1 + w, ny, h});
  return true;
}

// Two-pass chamfer distance.
void GlyphAtlas::distanceTransform(float* field, std::uint32_t w, std::uint32_t h) {
  constexpr float INF = 1e20f;
  constexpr float DIAG = 1.4142135f;

  for (std::uint32_t y = 0; y < h; y++) {
    for (std::uint32_t x = 0; x < w; x++) {
      std::size_t i = static_cast<std::size_t>(y) * w + x;
      if (field[i] == 0.0f) continue;
      float d = INF;
      if (x > 0) d = std::min(d, field[i - 1] + 1.0f);
      if (y > 0) d = std::min(d, field[i - w] + 1.0f);
      if (x > 0 && y > 0) d = std::min(d, field[i - w - 1] + DIAG);
      if (x + 1 < w && y > 0) d = std::min(d, field[i - w + 1] + DIAG);
      field[i] = d;
    }
  }

  for (std::uint32_t y = h; y-- > 0; ) {
    for (std::uint32_t x = w; x-- > 0; ) {
      std::size_t i = static_cast<std::size_t>(y) * w + x;
      if (field[i] == 0.0f) continue;
      if (x + 1 < w) field[i] = std::min(field[i], field[i + 1] + 1.0f);
      if (y + 1 < h) field[i] = std::min(field[i], field[i + w] + 1.0f);
      if (x + 1 < w && y + 1 < h) field[i] = std::min(field[i], field[i + w + 1] + DIAG);
      if (x > 0 && y + 1 < h) field[i] = std::min(field[i], field[i + w - 1] + DIAG);
    }
  }
}

void GlyphAtlas::buildSdfR8(const std::uint8_t* alpha, std::uint32_t w, std::uint32_t h,
                            std::uint32_t sdfRange, std::uint8_t* out) {
  std::size_t n = static_cast<std::size_t>(w) * h;
  float rangePx = static_cast<float>(sdfRange);

  std::vector<float> inside(n), outside(n);
  for (std::size_t i = 0; i < n; i++) {
    bool in = alpha[i] > 127;
    inside[i] = in ? 1.0f : 0.0f;
    outside[i] = in ? 0.0f : 1.0f;
  }
  distanceTransform(inside.data(), w, h);
  distanceTransform(outside.data(), w, h);

  for (std::size_t i = 0; i < n; i++) {
    float sd = std::max(-rangePx, std::min(rangePx, inside[i] - outside[i]));
    float v = 128.0f + (sd / rangePx) * 127.0f;
    out[i] = static_cast<std::uint8_t>(std::max(0.0f, std::min(255.0f, v)));
  }
}

} // namespace mtc
