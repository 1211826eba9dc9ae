#include "mtc/gl/GlRenderBackend.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <vector>

namespace mtc {

bool GlRenderBackend::init(GlyphAtlas* atlas) {
  if (!renderer_.init()) {
    std::fprintf(stderr, "GlRenderBackend::init: renderer init failed\n");
    return false;
  }
  renderer_.setGlyphAtlas(atlas);
  return true;
}

bool GlRenderBackend::render(const DrawList& list, Image& out) {
  if (!ready() || list.width() <= 0 || list.height() <= 0) return false;

  if (ctx_.width() < list.width() || ctx_.height() < list.height()) {
    int w = std::max(ctx_.width(), list.width());
    int h = std::max(ctx_.height(), list.height());
    if (!ctx_.resize(w, h)) return false;
  }

  stats_ = renderer_.render(list, buffers_, 0, 0);
  ctx_.swapBuffers();

  // Readback is bottom-up over the whole context; keep the list's rows.
  std::vector<std::uint8_t> pixels = ctx_.readPixels();
  const int cw = ctx_.width();
  out.width = list.width();
  out.height = list.height();
  out.rgba.assign(static_cast<std::size_t>(out.width) * out.height * 4, 0);
  const std::size_t rowBytes = static_cast<std::size_t>(out.width) * 4;
  for (int y = 0; y < out.height; y++) {
    // Framebuffer row y counts up from the bottom of the viewport.
    const std::uint8_t* src = &pixels[static_cast<std::size_t>(y) * cw * 4];
    std::memcpy(out.pixel(0, out.height - 1 - y), src, rowBytes);
  }
  return true;
}

} // namespace mtc
