#include "mtc/overlay/Sessions.hpp"
#include "mtc/math/TimeFormat.hpp"

namespace mtc {

const std::vector<SessionStyle>& sessionStyles() {
  static const std::vector<SessionStyle> styles = {
    {"asia",   "Asia",   0,  7,  cssColor("rgba(56,189,248,0.08)"),  cssColor("rgba(56,189,248,0.65)")},
    {"london", "London", 7,  13, cssColor("rgba(74,222,128,0.08)"),  cssColor("rgba(74,222,128,0.65)")},
    {"ny",     "NY",     13, 21, cssColor("rgba(251,191,36,0.08)"),  cssColor("rgba(251,191,36,0.65)")},
  };
  return styles;
}

const SessionStyle* sessionStyleForTs(std::int64_t epochMs) {
  int hour = utcHourOfDay(epochMs);
  for (const auto& s : sessionStyles()) {
    if (s.startHour <= s.endHour) {
      if (hour >= s.startHour && hour < s.endHour) return &s;
    } else if (hour >= s.startHour || hour < s.endHour) {
      return &s;
    }
  }
  return nullptr;
}

std::vector<SessionBlock> buildSessionBlocks(const CandleSeries& bars) {
  std::vector<SessionBlock> blocks;
  SessionBlock cur;
  bool open = false;

  for (std::size_t i = 0; i < bars.size(); i++) {
    int idx = static_cast<int>(i);
    const SessionStyle* style = sessionStyleForTs(bars[i].t);
    if (!style) {
      if (open) blocks.push_back(cur);
      open = false;
      continue;
    }
    if (!open || cur.style != style) {
      if (open) blocks.push_back(cur);
      cur = {style, idx, idx};
      open = true;
      continue;
    }
    cur.endIndex = idx;
  }
  if (open) blocks.push_back(cur);
  return blocks;
}

} // namespace mtc
