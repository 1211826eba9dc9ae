#pragma once
#include "mtc/data/Candle.hpp"
#include "mtc/overlay/OverlayLevel.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

// Where a pointer gesture happened.
enum class InteractionSource : std::uint8_t { Frame = 0, Fullscreen };

enum class PriceSelectMode : std::uint8_t { Off = 0, Entry, Sl, Tp };

const char* interactionSourceName(InteractionSource source);
const char* priceSelectModeName(PriceSelectMode mode);

struct SymbolChangeEvent {
  std::string symbol;
  std::string previous;
};

struct BarCloseEvent {
  std::string symbol;
  std::string frameId;
  std::string resolution;
  Candle bar;              // the bar that just closed
  CandleSeries bars;       // full series after the append
  std::int64_t updatedAtMs{0};
};

struct PriceSelectEvent {
  double price{0};
  std::string frameId;
  std::string resolution;
  InteractionSource source{InteractionSource::Frame};
  PriceSelectMode mode{PriceSelectMode::Entry};
};

// A dragged level was released at a new price. The host turns this into a
// position/order modification.
struct LevelUpdateEvent {
  std::string levelId;
  double price{0};
  std::string frameId;
  std::string resolution;
  InteractionSource source{InteractionSource::Frame};
  LevelMeta meta;
  bool hasMeta{false};
};

struct FrameMeta {
  std::string resolution;
  std::string label;
  std::uint32_t bars{0};
  std::int64_t updatedAtMs{0};
};

struct ChartMeta {
  std::string symbol;
  std::int64_t updatedAtMs{0};
  std::vector<FrameMeta> frames;
};

struct CaptureEvent {
  std::vector<std::uint8_t> png;
  int width{0};
  int height{0};
  ChartMeta meta;
};

} // namespace mtc
