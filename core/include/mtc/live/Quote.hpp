#pragma once
#include <cstdint>
#include <string>

namespace mtc {

// One pushed quote. Absent fields carry has* = false.
struct LiveQuote {
  std::string symbol;
  double bid{0}, ask{0}, last{0}, mid{0};
  bool hasBid{false}, hasAsk{false}, hasLast{false}, hasMid{false};
  std::int64_t timestampMs{0};   // epoch seconds are accepted too
};

// mid, else last, else (bid+ask)/2, else bid, else ask.
bool resolveQuotePrice(const LiveQuote& q, double& price);

// Scale epoch seconds (<= 1e11) to ms. Returns 0 for non-positive input.
std::int64_t normalizeQuoteTs(std::int64_t raw);

} // namespace mtc
