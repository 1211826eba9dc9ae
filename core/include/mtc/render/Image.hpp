#pragma once
#include "mtc/style/Theme.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mtc {

// Top-down RGBA8 pixel buffer.
struct Image {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> rgba;

  bool empty() const { return width <= 0 || height <= 0 || rgba.empty(); }

  void resize(int w, int h, const Color& fill);

  std::uint8_t* pixel(int x, int y) {
    return &rgba[(static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                  static_cast<std::size_t>(x)) * 4];
  }
  const std::uint8_t* pixel(int x, int y) const {
    return &rgba[(static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                  static_cast<std::size_t>(x)) * 4];
  }

  // Source-over blend of one pixel; out-of-bounds writes are dropped.
  void blendPixel(int x, int y, const Color& c, float coverage = 1.0f);

  // Alpha-blended fill, clipped to the image.
  void fillRect(int x, int y, int w, int h, const Color& c);

  // Opaque copy of src with its top-left at (dx, dy), clipped.
  void blit(const Image& src, int dx, int dy);

  // Flip rows in place (GL readback is bottom-up).
  void flipVertical();
};

} // namespace mtc
