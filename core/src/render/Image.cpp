#include "mtc/render/Image.hpp"

#include <algorithm>
#include <cstring>

namespace mtc {

static std::uint8_t toByte(float v) {
  v = std::max(0.0f, std::min(1.0f, v));
  return static_cast<std::uint8_t>(v * 255.0f + 0.5f);
}

void Image::resize(int w, int h, const Color& fill) {
  width = std::max(0, w);
  height = std::max(0, h);
  rgba.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4, 0);
  const std::uint8_t px[4] = {toByte(fill.r), toByte(fill.g), toByte(fill.b), toByte(fill.a)};
  for (std::size_t i = 0; i < rgba.size(); i += 4) {
    std::memcpy(&rgba[i], px, 4);
  }
}

void Image::blendPixel(int x, int y, const Color& c, float coverage) {
  if (x < 0 || y < 0 || x >= width || y >= height) return;
  float a = std::max(0.0f, std::min(1.0f, c.a * coverage));
  if (a <= 0.0f) return;
  std::uint8_t* p = pixel(x, y);
  const float src[3] = {c.r, c.g, c.b};
  for (int k = 0; k < 3; k++) {
    float dst = static_cast<float>(p[k]) / 255.0f;
    p[k] = toByte(src[k] * a + dst * (1.0f - a));
  }
  float da = static_cast<float>(p[3]) / 255.0f;
  p[3] = toByte(a + da * (1.0f - a));
}

void Image::fillRect(int x, int y, int w, int h, const Color& c) {
  int x0 = std::max(0, x);
  int y0 = std::max(0, y);
  int x1 = std::min(width, x + w);
  int y1 = std::min(height, y + h);
  for (int py = y0; py < y1; py++) {
    for (int px = x0; px < x1; px++) blendPixel(px, py, c);
  }
}

void Image::blit(const Image& src, int dx, int dy) {
  if (src.empty() || empty()) return;
  int x0 = std::max(0, dx);
  int x1 = std::min(width, dx + src.width);
  if (x1 <= x0) return;
  std::size_t bytes = static_cast<std::size_t>(x1 - x0) * 4;
  for (int sy = 0; sy < src.height; sy++) {
    int ty = dy + sy;
    if (ty < 0 || ty >= height) continue;
    std::memcpy(pixel(x0, ty), src.pixel(x0 - dx, sy), bytes);
  }
}

void Image::flipVertical() {
  if (empty()) return;
  std::size_t rowBytes = static_cast<std::size_t>(width) * 4;
  std::vector<std::uint8_t> tmp(rowBytes);
  for (int y = 0; y < height / 2; y++) {
    std::uint8_t* a = pixel(0, y);
    std::uint8_t* b = pixel(0, height - 1 - y);
    std::memcpy(tmp.data(), a, rowBytes);
    std::memcpy(a, b, rowBytes);
    std::memcpy(b, tmp.data(), rowBytes);
  }
}

} // namespace mtc
