#pragma once
#include "mtc/debug/Stats.hpp"
#include "mtc/gl/GpuBufferManager.hpp"
#include "mtc/gl/ShaderProgram.hpp"
#include "mtc/render/DrawList.hpp"
#include <glad/gl.h>

namespace mtc {

class GlyphAtlas;

// Draws DrawList batches with one instanced program per batch kind. All
// geometry arrives in pixels (y down); u_transform maps it to clip space.
class Renderer {
public:
  Renderer() = default;
  ~Renderer();

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  // Compile shaders, create VAO and atlas texture. GL context must be current.
  bool init();
  bool inited() const { return inited_; }

  // Text batches are skipped without an atlas that has a font.
  void setGlyphAtlas(GlyphAtlas* atlas) { atlas_ = atlas; }

  // Draws into the list-sized viewport whose bottom-left corner is at
  // (viewX, viewY) in framebuffer pixels, clearing it first.
  Stats render(const DrawList& list, GpuBufferManager& bufs, int viewX = 0, int viewY = 0);

private:
  void drawRects(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats);
  void drawLines(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats);
  void drawCandles(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats);
  void drawTriangles(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats);
  void drawText(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats);
  void uploadAtlasIfDirty();

  ShaderProgram rectProg_;     // rect4, instanced
  ShaderProgram lineProg_;     // rect4 segment, AA fringe
  ShaderProgram candleProg_;   // candle6, wick + body
  ShaderProgram triProg_;      // x,y,alpha
  ShaderProgram textProg_;     // glyph8

  GLuint vao_{0};
  GLuint atlasTexture_{0};
  bool inited_{false};
  float transform_[9] = {1, 0, 0, 0, 1, 0, 0, 0, 1};

  GlyphAtlas* atlas_{nullptr};
};

} // namespace mtc
