#pragma once
#include "mtc/debug/Stats.hpp"
#include "mtc/gl/GlContext.hpp"
#include "mtc/gl/GpuBufferManager.hpp"
#include "mtc/gl/Renderer.hpp"
#include "mtc/render/RenderBackend.hpp"

namespace mtc {

class GlyphAtlas;

// RenderBackend over a current GL context: draws the list at the origin,
// reads it back and flips it top-down. The context is resized to the list
// when it is too small.
class GlRenderBackend : public RenderBackend {
public:
  explicit GlRenderBackend(GlContext& ctx) : ctx_(ctx) {}

  // Builds the renderer. Returns false (and logs) if shaders fail.
  bool init(GlyphAtlas* atlas);
  bool ready() const { return renderer_.inited(); }

  bool render(const DrawList& list, Image& out) override;

  const Stats& lastStats() const { return stats_; }

private:
  GlContext& ctx_;
  Renderer renderer_;
  GpuBufferManager buffers_;
  Stats stats_;
};

} // namespace mtc
