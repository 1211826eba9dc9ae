#pragma once
#include "mtc/gl/GlContext.hpp"

#ifdef MTC_HAS_GLFW

#include <string>

struct GLFWwindow;

namespace mtc {

// Left-button pointer state accumulated between polls. Coordinates are
// window pixels, y down.
struct PointerInput {
  double cursorX{0};
  double cursorY{0};
  bool pressed{false};     // went down since the last poll
  bool released{false};    // went up since the last poll
  bool buttonDown{false};
  double pressX{0}, pressY{0};
  double releaseX{0}, releaseY{0};
  bool shouldClose{false};
};

class GlfwContext : public GlContext {
public:
  explicit GlfwContext(std::string title = "mtc chart");
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  bool resize(int width, int height) override;
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

  PointerInput pollInput();
  bool shouldClose() const;

private:
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);

  std::string title_;
  GLFWwindow* window_{nullptr};
  int width_{0};
  int height_{0};
  PointerInput pending_;
};

} // namespace mtc

#endif // MTC_HAS_GLFW
