#include "mtc/live/BarSynthesizer.hpp"
#include "mtc/data/Resolution.hpp"

#include <algorithm>
#include <cmath>

namespace mtc {

TickOutcome applyTick(CandleSeries& bars, double price, std::int64_t ts,
                      std::int64_t resolutionMs, std::size_t capacity,
                      Candle* closed) {
  if (bars.empty() || resolutionMs <= 0) return TickOutcome::Ignored;

  std::int64_t bucket = bucketStart(ts, resolutionMs);
  Candle& last = bars.back();
  if (bucket < last.t) return TickOutcome::Ignored;

  if (bucket == last.t) {
    double h = std::max(last.h, price);
    double l = std::min(last.l, price);
    if (last.c == price && last.h == h && last.l == l) return TickOutcome::Unchanged;
    last.h = h;
    last.l = l;
    last.c = price;
    return TickOutcome::Extended;
  }

  if (closed) *closed = last;
  Candle next;
  next.t = bucket;
  next.o = last.c;
  next.h = std::max(next.o, price);
  next.l = std::min(next.o, price);
  next.c = price;
  bars.push_back(next);

  if (capacity > 0 && bars.size() > capacity) {
    bars.erase(bars.begin(),
               bars.begin() + static_cast<std::ptrdiff_t>(bars.size() - capacity));
  }
  return TickOutcome::Appended;
}

std::vector<BarCloseEvent> LiveBarSynthesizer::applyQuote(const std::string& symbol,
                                                          double price, std::int64_t ts) {
  std::vector<BarCloseEvent> events;
  lastChanged_ = false;
  if (!std::isfinite(price) || price <= 0) return events;
  if (ts <= 0) return events;

  for (const FrameConfig* frame : frames_.activeConfigs()) {
    FrameState* st = frames_.state(frame->id);
    if (!st || st->bars.empty()) continue;

    Candle closedBar;
    TickOutcome out = applyTick(st->bars, price, ts, resolutionMs(frame->resolution),
                                frame->capacity(), &closedBar);
    if (out != TickOutcome::Extended && out != TickOutcome::Appended) continue;

    st->updatedAtMs = std::max(st->updatedAtMs, ts);
    lastChanged_ = true;

    if (out == TickOutcome::Appended) {
      BarCloseEvent ev;
      ev.symbol = symbol;
      ev.frameId = frame->id;
      ev.resolution = frame->resolution;
      ev.bar = closedBar;
      ev.bars = st->bars;
      ev.updatedAtMs = ts;
      events.push_back(std::move(ev));
    }
  }
  return events;
}

} // namespace mtc
