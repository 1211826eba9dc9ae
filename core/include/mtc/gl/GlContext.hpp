#pragma once
#include <cstdint>
#include <vector>

namespace mtc {

class GlContext {
public:
  virtual ~GlContext() = default;

  virtual bool init(int width, int height) = 0;

  // Change the drawable size. Returns false if the context cannot follow.
  virtual bool resize(int width, int height) = 0;
  virtual void swapBuffers() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // Bottom-up RGBA rows, as glReadPixels returns them.
  virtual std::vector<std::uint8_t> readPixels() const = 0;
};

} // namespace mtc
