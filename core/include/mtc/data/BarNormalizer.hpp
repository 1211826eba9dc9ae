#pragma once
#include "mtc/data/Candle.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <string>

namespace mtc {

struct NormalizeResult {
  CandleSeries bars;
  std::uint32_t dropped{0};   // malformed records skipped
};

// Convert one raw record. Tolerant field naming:
//   time  t|time|timestamp   (> 1e11 treated as ms, otherwise seconds)
//   open  o|open|c|close
//   high  h|high, else max(open, low)
//   low   l|low, else min(open, high)
//   close c|close|o|open
//   vol   v|volume
// Numeric strings may carry thousands separators. Returns false if time,
// open or close cannot be resolved.
bool normalizeBar(const rapidjson::Value& record, Candle& out);

// Normalize an array of records, sorted ascending by t. Duplicate timestamps
// keep the last record.
NormalizeResult normalizeBars(const rapidjson::Value& records);

// Same, from JSON text: either an array or an object with a "bars" array.
// Returns false on a parse error (out is left empty).
bool normalizeBarsJson(const std::string& json, NormalizeResult& out);

} // namespace mtc
