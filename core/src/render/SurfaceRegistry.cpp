#include "mtc/render/SurfaceRegistry.hpp"

#include <algorithm>

namespace mtc {

bool SurfaceRegistry::resize(const std::string& frameId, int width, int height) {
  width = std::max(1, width);
  height = std::max(1, height);
  Surface& s = surfaces_[frameId];
  if (s.width == width && s.height == height) return false;
  s.width = width;
  s.height = height;
  s.dirty = true;
  notify(frameId, width, height);
  return true;
}

bool SurfaceRegistry::resizeFullscreen(int width, int height) {
  width = std::max(1, width);
  height = std::max(1, height);
  if (fullscreen_.width == width && fullscreen_.height == height) return false;
  fullscreen_.width = width;
  fullscreen_.height = height;
  fullscreen_.dirty = true;
  if (hasFullscreen()) notify(fullscreenFrame_, width, height);
  return true;
}

void SurfaceRegistry::setFullscreenFrame(const std::string& frameId) {
  if (fullscreenFrame_ == frameId) return;
  fullscreenFrame_ = frameId;
  fullscreen_.image = Image{};
  fullscreen_.dirty = true;
}

void SurfaceRegistry::clearFullscreen() {
  fullscreenFrame_.clear();
  fullscreen_.image = Image{};
}

Surface* SurfaceRegistry::find(const std::string& frameId) {
  auto it = surfaces_.find(frameId);
  return it == surfaces_.end() ? nullptr : &it->second;
}

const Surface* SurfaceRegistry::find(const std::string& frameId) const {
  auto it = surfaces_.find(frameId);
  return it == surfaces_.end() ? nullptr : &it->second;
}

void SurfaceRegistry::remove(const std::string& frameId) {
  surfaces_.erase(frameId);
  if (fullscreenFrame_ == frameId) clearFullscreen();
}

void SurfaceRegistry::markAllDirty() {
  for (auto& kv : surfaces_) kv.second.dirty = true;
  fullscreen_.dirty = true;
}

std::vector<std::string> SurfaceRegistry::ids() const {
  std::vector<std::string> out;
  out.reserve(surfaces_.size());
  for (const auto& kv : surfaces_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

int SurfaceRegistry::addResizeListener(ResizeListener fn) {
  int handle = nextListener_++;
  listeners_.emplace_back(handle, std::move(fn));
  return handle;
}

void SurfaceRegistry::removeResizeListener(int handle) {
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [handle](const std::pair<int, ResizeListener>& l) {
                                    return l.first == handle;
                                  }),
                   listeners_.end());
}

void SurfaceRegistry::notify(const std::string& frameId, int width, int height) {
  auto copy = listeners_;
  for (auto& l : copy) {
    if (l.second) l.second(frameId, width, height);
  }
}

} // namespace mtc
