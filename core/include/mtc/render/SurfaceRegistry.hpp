#pragma once
#include "mtc/render/Image.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mtc {

struct Surface {
  int width{0};
  int height{0};
  Image image;          // last rendered pixels, may be empty
  bool dirty{true};     // needs a redraw
};

using ResizeListener = std::function<void(const std::string& frameId, int width, int height)>;

// frameId -> render surface, plus one fullscreen slot shown for a single
// frame at a time.
class SurfaceRegistry {
public:
  // Creates the surface if needed. Listeners fire only on a real change.
  // Returns true if the size changed.
  bool resize(const std::string& frameId, int width, int height);

  bool resizeFullscreen(int width, int height);
  void setFullscreenFrame(const std::string& frameId);
  void clearFullscreen();
  const std::string& fullscreenFrame() const { return fullscreenFrame_; }
  bool hasFullscreen() const { return !fullscreenFrame_.empty(); }

  Surface* find(const std::string& frameId);
  const Surface* find(const std::string& frameId) const;
  Surface* fullscreen() { return hasFullscreen() ? &fullscreen_ : nullptr; }
  const Surface* fullscreen() const { return hasFullscreen() ? &fullscreen_ : nullptr; }

  void remove(const std::string& frameId);
  void markAllDirty();
  std::vector<std::string> ids() const;

  // Returns a handle for removeResizeListener.
  int addResizeListener(ResizeListener fn);
  void removeResizeListener(int handle);

private:
  void notify(const std::string& frameId, int width, int height);

  std::unordered_map<std::string, Surface> surfaces_;
  Surface fullscreen_;
  std::string fullscreenFrame_;

  std::vector<std::pair<int, ResizeListener>> listeners_;
  int nextListener_{1};
};

} // namespace mtc
