#include "mtc/events/Events.hpp"

namespace mtc {

const char* interactionSourceName(InteractionSource source) {
  return source == InteractionSource::Fullscreen ? "fullscreen" : "frame";
}

const char* priceSelectModeName(PriceSelectMode mode) {
  switch (mode) {
    case PriceSelectMode::Off:   return "off";
    case PriceSelectMode::Entry: return "entry";
    case PriceSelectMode::Sl:    return "sl";
    case PriceSelectMode::Tp:    return "tp";
  }
  return "off";
}

} // namespace mtc
