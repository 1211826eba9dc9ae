#include "mtc/interaction/InteractionEngine.hpp"

#include <cmath>

namespace mtc {

const OverlayLevel* findDraggableLevel(const PlotMeta& meta, double y,
                                       const LevelList& draggable, double tolerancePx) {
  if (meta.plot.h <= 0) return nullptr;
  const OverlayLevel* best = nullptr;
  double bestDist = 0;
  for (const auto& lv : draggable) {
    if (!lv.draggable || !std::isfinite(lv.price)) continue;
    double dist = std::fabs(meta.priceToY(lv.price) - y);
    if (dist <= tolerancePx && (!best || dist < bestDist)) {
      best = &lv;
      bestDist = dist;
    }
  }
  return best;
}

const PlotMeta* InteractionEngine::lookup(const std::string& frameId,
                                          InteractionSource source) const {
  if (source == InteractionSource::Fullscreen) return cache_.fullscreen();
  return cache_.find(frameId);
}

bool InteractionEngine::pointerDown(const std::string& frameId, InteractionSource source,
                                    double x, double y, const LevelList& draggable) {
  if (state_ == GestureState::ClickPending) state_ = GestureState::Idle;
  if (state_ == GestureState::Dragging) return false;

  const PlotMeta* meta = lookup(frameId, source);
  if (!meta || meta->plot.w <= 0 || meta->plot.h <= 0) return false;
  if (x < meta->plot.x || x > meta->plot.x + meta->plot.w) return false;

  const OverlayLevel* hit = findDraggableLevel(*meta, y, draggable, config_.hitTolerancePx);
  if (!hit) return false;

  drag_ = DragState{};
  drag_.level = *hit;
  drag_.frameId = frameId;
  drag_.resolution = meta->resolution;
  drag_.source = source;
  drag_.meta = *meta;
  drag_.lastPrice = hit->price;
  drag_.didMove = false;

  // The preview needs its own id so dedup keeps it next to the dragged level.
  preview_ = *hit;
  preview_.id = hit->id.empty() ? std::string() : "drag_" + hit->id;
  preview_.kind = LevelKind::Drag;
  preview_.style = LevelStyle::Dashed;
  preview_.priority = 30;

  state_ = GestureState::Dragging;
  return true;
}

bool InteractionEngine::pointerMove(double y) {
  if (state_ != GestureState::Dragging) return false;
  double price = 0;
  if (!drag_.meta.yToPrice(y, price)) return false;

  double lastY = drag_.meta.priceToY(drag_.lastPrice);
  if (std::fabs(y - lastY) > config_.dragConfirmPx) drag_.didMove = true;
  drag_.lastPrice = price;
  preview_.price = price;
  return true;
}

bool InteractionEngine::pointerUp(double y) {
  if (state_ != GestureState::Dragging) return false;
  DragState done = drag_;
  state_ = done.didMove ? GestureState::ClickPending : GestureState::Idle;

  double price = 0;
  if (!done.didMove || !done.meta.yToPrice(y, price)) return false;

  LevelUpdateEvent ev;
  ev.levelId = done.level.id;
  ev.price = price;
  ev.frameId = done.frameId;
  ev.resolution = done.resolution;
  ev.source = done.source;
  ev.hasMeta = done.level.meta.entity != LevelEntity::None;
  ev.meta = done.level.meta;
  levelUpdates_.emit(ev);
  return true;
}

bool InteractionEngine::click(const std::string& frameId, InteractionSource source, double y) {
  if (state_ == GestureState::ClickPending) {
    state_ = GestureState::Idle;
    return false;
  }
  if (state_ == GestureState::Dragging) return false;
  if (mode_ == PriceSelectMode::Off) return false;

  const PlotMeta* meta = lookup(frameId, source);
  if (!meta) return false;
  double price = 0;
  if (!meta->yToPrice(y, price)) return false;

  PriceSelectEvent ev;
  ev.price = price;
  ev.frameId = frameId;
  ev.resolution = meta->resolution;
  ev.source = source;
  ev.mode = mode_;
  priceSelects_.emit(ev);
  return true;
}

void InteractionEngine::cancel() {
  state_ = GestureState::Idle;
}

const OverlayLevel* InteractionEngine::dragPreview() const {
  return state_ == GestureState::Dragging ? &preview_ : nullptr;
}

} // namespace mtc
