#include "mtc/gl/OsMesaContext.hpp"

#include <algorithm>
#include <cstdio>

namespace mtc {

OsMesaContext::OsMesaContext() = default;

OsMesaContext::~OsMesaContext() {
  if (ctx_) OSMesaDestroyContext(ctx_);
}

bool OsMesaContext::makeCurrent() {
  framebuf_.assign(static_cast<std::size_t>(width_) * height_ * 4, 0);
  if (!OSMesaMakeCurrent(ctx_, framebuf_.data(), GL_UNSIGNED_BYTE, width_, height_)) {
    std::fprintf(stderr, "OsMesaContext::makeCurrent: OSMesaMakeCurrent failed (%dx%d)\n",
                 width_, height_);
    return false;
  }
  return true;
}

bool OsMesaContext::init(int width, int height) {
  static const int attribs[] = {
    OSMESA_FORMAT,                OSMESA_RGBA,
    OSMESA_DEPTH_BITS,            0,
    OSMESA_STENCIL_BITS,          0,
    OSMESA_PROFILE,               OSMESA_CORE_PROFILE,
    OSMESA_CONTEXT_MAJOR_VERSION, 3,
    OSMESA_CONTEXT_MINOR_VERSION, 3,
    0
  };

  ctx_ = OSMesaCreateContextAttribs(attribs, nullptr);
  if (!ctx_) {
    std::fprintf(stderr, "OsMesaContext::init: OSMesaCreateContextAttribs failed\n");
    return false;
  }

  width_ = std::max(1, width);
  height_ = std::max(1, height);
  if (!makeCurrent()) {
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }

  if (!gladLoadGL((GLADloadfunc)OSMesaGetProcAddress)) {
    std::fprintf(stderr, "OsMesaContext::init: gladLoadGL failed\n");
    OSMesaDestroyContext(ctx_);
    ctx_ = nullptr;
    return false;
  }
  return true;
}

bool OsMesaContext::resize(int width, int height) {
  if (!ctx_) return false;
  width = std::max(1, width);
  height = std::max(1, height);
  if (width == width_ && height == height_) return true;
  width_ = width;
  height_ = height;
  return makeCurrent();
}

void OsMesaContext::swapBuffers() {
  glFinish();
}

std::vector<std::uint8_t> OsMesaContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

} // namespace mtc
