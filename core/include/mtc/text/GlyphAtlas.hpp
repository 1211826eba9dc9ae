#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace mtc {

// Atlas rows run top-down. v0 is the glyph's top row, v1 its bottom row.
struct GlyphInfo {
  std::uint32_t codepoint{0};
  float u0{0}, v0{0}, u1{0}, v1{0};
  // Pixel metrics at glyphPx.
  float advance{0};
  float bearingX{0};
  float bearingY{0};   // baseline to glyph top, positive up
  float w{0}, h{0};
  // Integer atlas rect, for CPU sampling.
  std::uint32_t ax{0}, ay{0};
};

// R8 glyph atlas rasterized with stb_truetype and packed on shelves.
// Raw coverage by default; SDF when setUseSdf(true).
class GlyphAtlas {
public:
  GlyphAtlas();

  bool loadFont(const std::uint8_t* data, std::uint32_t len);
  bool loadFontFile(const std::string& path);
  bool fontLoaded() const { return fontLoaded_; }

  // Rasterize and pack any missing glyphs. Returns true if pixels changed.
  bool ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count);
  bool ensureAscii();

  const GlyphInfo* getGlyph(std::uint32_t codepoint) const;

  const std::uint8_t* atlasData() const { return atlas_.data(); }
  std::uint32_t atlasSize() const { return atlasSize_; }

  bool isDirty() const { return dirty_; }
  void clearDirty() { dirty_ = false; }

  // Changing either clears packed glyphs.
  void setGlyphPx(std::uint32_t px);
  void setAtlasSize(std::uint32_t s);
  std::uint32_t glyphPx() const { return glyphPx_; }

  void setSdfRange(std::uint32_t r) { sdfRange_ = r; }
  std::uint32_t sdfRange() const { return sdfRange_; }
  void setUseSdf(bool v);
  bool useSdf() const { return useSdf_; }

private:
  bool packGlyph(std::uint32_t w, std::uint32_t h, std::uint32_t& outX, std::uint32_t& outY);
  void resetPacking();

  static void distanceTransform(float* field, std::uint32_t w, std::uint32_t h);
  static void buildSdfR8(const std::uint8_t* alpha, std::uint32_t w, std::uint32_t h,
                         std::uint32_t sdfRange, std::uint8_t* out);

  std::uint32_t atlasSize_{512};
  std::uint32_t glyphPx_{16};
  std::uint32_t sdfRange_{6};
  std::uint32_t pad_{1};
  bool useSdf_{false};

  std::vector<std::uint8_t> atlas_;
  std::vector<std::uint8_t> fontData_;
  bool fontLoaded_{false};
  bool dirty_{false};

  std::unordered_map<std::uint32_t, GlyphInfo> glyphs_;

  struct Shelf {
    std::uint32_t x, y, h;
  };
  std::vector<Shelf> shelves_;
};

} // namespace mtc
