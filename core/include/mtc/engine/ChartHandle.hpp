#pragma once
#include "mtc/events/Events.hpp"
#include "mtc/overlay/LevelCompositor.hpp"
#include "mtc/render/Image.hpp"

#include <string>
#include <vector>

namespace mtc {

// Host-facing control surface of a chart. Implemented by ChartEngine and
// held by whatever embeds it.
class ChartHandle {
public:
  virtual ~ChartHandle() = default;

  // Returns true if the normalized symbol changed.
  virtual bool focusSymbol(const std::string& symbol) = 0;

  virtual bool ensureFrameActive(const std::string& timeframe) = 0;
  virtual bool toggleFrame(const std::string& frameId) = 0;
  virtual bool setActiveFrames(const std::vector<std::string>& frameIds) = 0;

  // Forced history refresh of every active frame.
  virtual void refresh() = 0;

  virtual bool setOverlayVisible(OverlayToggle overlay, bool visible) = 0;

  // Composite of every active frame with data, handed to capture listeners.
  // Returns false when nothing could be captured.
  virtual bool captureAll() = 0;
  virtual bool captureSnapshot(Image& out) = 0;
  virtual bool captureFrameSnapshot(const std::string& frameId, Image& out) = 0;

  virtual ChartMeta getMeta() const = 0;
};

} // namespace mtc
