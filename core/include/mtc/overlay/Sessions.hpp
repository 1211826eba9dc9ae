#pragma once
#include "mtc/data/Candle.hpp"
#include "mtc/style/Theme.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

// Trading session window in UTC hours, [startHour, endHour). A window with
// start > end wraps midnight.
struct SessionStyle {
  std::string id;
  std::string label;
  int startHour{0};
  int endHour{0};
  Color fill;
  Color line;
};

// Asia 0-7, London 7-13, NY 13-21.
const std::vector<SessionStyle>& sessionStyles();

// nullptr outside every session.
const SessionStyle* sessionStyleForTs(std::int64_t epochMs);

// Contiguous run of bars in the same session (indices inclusive).
struct SessionBlock {
  const SessionStyle* style{nullptr};
  int startIndex{0};
  int endIndex{0};
};

std::vector<SessionBlock> buildSessionBlocks(const CandleSeries& bars);

} // namespace mtc
