#ifdef MTC_HAS_GLFW

#include "mtc/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>

namespace mtc {

GlfwContext::GlfwContext(std::string title) : title_(std::move(title)) {}

GlfwContext::~GlfwContext() {
  if (window_) glfwDestroyWindow(window_);
  glfwTerminate();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext::init: glfwInit failed\n");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);

  window_ = glfwCreateWindow(width, height, title_.c_str(), nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext::init: glfwCreateWindow failed\n");
    glfwTerminate();
    return false;
  }
  glfwMakeContextCurrent(window_);

  if (!gladLoadGL((GLADloadfunc)glfwGetProcAddress)) {
    std::fprintf(stderr, "GlfwContext::init: gladLoadGL failed\n");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
    return false;
  }

  glfwGetFramebufferSize(window_, &width_, &height_);
  glfwSetWindowUserPointer(window_, this);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwGetCursorPos(window_, &pending_.cursorX, &pending_.cursorY);
  return true;
}

bool GlfwContext::resize(int width, int height) {
  if (!window_) return false;
  glfwSetWindowSize(window_, width, height);
  glfwGetFramebufferSize(window_, &width_, &height_);
  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) glfwSwapBuffers(window_);
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

bool GlfwContext::shouldClose() const {
  return window_ && glfwWindowShouldClose(window_);
}

PointerInput GlfwContext::pollInput() {
  glfwPollEvents();
  if (window_) glfwGetFramebufferSize(window_, &width_, &height_);

  PointerInput out = pending_;
  out.shouldClose = shouldClose();

  pending_.pressed = false;
  pending_.released = false;
  return out;
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;
  self->pending_.cursorX = x;
  self->pending_.cursorY = y;
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int /*mods*/) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self || button != GLFW_MOUSE_BUTTON_LEFT) return;

  PointerInput& p = self->pending_;
  if (action == GLFW_PRESS) {
    p.pressed = true;
    p.buttonDown = true;
    p.pressX = p.cursorX;
    p.pressY = p.cursorY;
  } else if (action == GLFW_RELEASE) {
    p.released = true;
    p.buttonDown = false;
    p.releaseX = p.cursorX;
    p.releaseY = p.cursorY;
  }
}

} // namespace mtc

#endif // MTC_HAS_GLFW
