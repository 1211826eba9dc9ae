#pragma once
#include "mtc/data/Candle.hpp"
#include "mtc/history/Coverage.hpp"

#include <cstdint>
#include <string>

namespace mtc {

// Mutable state of one active frame. Replaced wholesale by the history
// fetcher, tail-mutated by the live bar synthesizer.
struct FrameState {
  CandleSeries bars;
  std::int64_t updatedAtMs{0};
  std::string source;
  std::string error;
  Coverage coverage;
  bool hasCoverage{false};
  bool loading{false};
  std::uint64_t token{0};   // refresh cycle that last wrote bars
};

} // namespace mtc
