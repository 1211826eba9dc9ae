#pragma once
#include "mtc/data/Candle.hpp"
#include "mtc/events/Events.hpp"
#include "mtc/frames/FrameManager.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

enum class TickOutcome : std::uint8_t {
  Ignored = 0,   // empty series, unknown resolution, or late tick
  Unchanged,     // same bucket, nothing moved
  Extended,      // same bucket, h/l/c updated
  Appended       // new bucket, previous bar closed
};

// Fold one tick into a sorted series. On Appended, *closed (if given)
// receives the bar that just closed and the series is trimmed from the
// front to capacity.
TickOutcome applyTick(CandleSeries& bars, double price, std::int64_t ts,
                      std::int64_t resolutionMs, std::size_t capacity,
                      Candle* closed = nullptr);

// Applies live quotes to every active frame that already has bars. Never
// touches the network.
class LiveBarSynthesizer {
public:
  explicit LiveBarSynthesizer(FrameManager& frames) : frames_(frames) {}

  // Returns one event per frame whose bar closed. Ticks with price <= 0 or
  // ts <= 0 are rejected. Returns an empty list if nothing closed. The symbol
  // is copied into each event as given, empty included.
  std::vector<BarCloseEvent> applyQuote(const std::string& symbol,
                                        double price, std::int64_t ts);

  // True if the last applyQuote() changed any frame.
  bool lastChanged() const { return lastChanged_; }

private:
  FrameManager& frames_;
  bool lastChanged_{false};
};

} // namespace mtc
