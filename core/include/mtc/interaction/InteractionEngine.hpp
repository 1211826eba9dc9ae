#pragma once
#include "mtc/events/EventEmitter.hpp"
#include "mtc/events/Events.hpp"
#include "mtc/geometry/PlotGeometry.hpp"
#include "mtc/overlay/OverlayLevel.hpp"

#include <cstdint>
#include <string>

namespace mtc {

// Idle -> Dragging -> (moved) ClickPending -> Idle
//                  -> (not moved) Idle
enum class GestureState : std::uint8_t {
  Idle = 0,
  Dragging,
  ClickPending    // next click is swallowed
};

struct InteractionConfig {
  double hitTolerancePx{6};
  double dragConfirmPx{2};
};

// Active drag gesture. Holds a copy of the PlotMeta that was on screen at
// pointer-down so later moves invert against the same transform.
struct DragState {
  OverlayLevel level;
  std::string frameId;
  std::string resolution;
  InteractionSource source{InteractionSource::Frame};
  PlotMeta meta;
  double lastPrice{0};
  bool didMove{false};
};

// Nearest draggable level within tolerancePx of y, or nullptr.
const OverlayLevel* findDraggableLevel(const PlotMeta& meta, double y,
                                       const LevelList& draggable, double tolerancePx);

// Pointer coordinates are surface-local pixels (y down). Window-level
// move/up events should be routed here while wantsWindowEvents() is true.
class InteractionEngine {
public:
  explicit InteractionEngine(const PlotMetaCache& cache) : cache_(cache) {}

  void setConfig(const InteractionConfig& cfg) { config_ = cfg; }
  const InteractionConfig& config() const { return config_; }

  void setPriceSelectMode(PriceSelectMode mode) { mode_ = mode; }
  PriceSelectMode priceSelectMode() const { return mode_; }

  // Starts a drag if a draggable level is under the pointer. Returns true
  // when a drag started.
  bool pointerDown(const std::string& frameId, InteractionSource source,
                   double x, double y, const LevelList& draggable);

  // Returns true if the preview moved.
  bool pointerMove(double y);

  // Ends the drag. Emits a LevelUpdateEvent if the pointer really moved.
  // Returns true if an event was emitted.
  bool pointerUp(double y);

  // Plain click. Swallowed after a drag; otherwise emits a PriceSelectEvent
  // when a select mode is active. Returns true if an event was emitted.
  bool click(const std::string& frameId, InteractionSource source, double y);

  // Abandon any gesture without emitting.
  void cancel();

  GestureState state() const { return state_; }
  bool wantsWindowEvents() const { return state_ == GestureState::Dragging; }
  const DragState* drag() const { return state_ == GestureState::Dragging ? &drag_ : nullptr; }

  // Preview level (kind Drag) while dragging, nullptr otherwise.
  const OverlayLevel* dragPreview() const;

  EventEmitter<LevelUpdateEvent>& levelUpdates() { return levelUpdates_; }
  EventEmitter<PriceSelectEvent>& priceSelects() { return priceSelects_; }

private:
  const PlotMeta* lookup(const std::string& frameId, InteractionSource source) const;

  const PlotMetaCache& cache_;
  InteractionConfig config_;
  PriceSelectMode mode_{PriceSelectMode::Off};

  GestureState state_{GestureState::Idle};
  DragState drag_;
  OverlayLevel preview_;

  EventEmitter<LevelUpdateEvent> levelUpdates_;
  EventEmitter<PriceSelectEvent> priceSelects_;
};

} // namespace mtc
