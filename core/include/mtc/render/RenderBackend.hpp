#pragma once
#include "mtc/render/DrawList.hpp"
#include "mtc/render/Image.hpp"

namespace mtc {

// Rasterizes a DrawList into a top-down RGBA image of the list's size.
class RenderBackend {
public:
  virtual ~RenderBackend() = default;

  // False when the backend cannot produce pixels (no context, bad size).
  virtual bool render(const DrawList& list, Image& out) = 0;
};

} // namespace mtc
