#pragma once
#include <cstdint>
#include <string>

namespace mtc {

// Static resolution table. Single source of truth for bucket width.
struct ResolutionInfo {
  const char* key;        // canonical key, e.g. "1m", "4H"
  std::int64_t durationMs;
};

inline constexpr ResolutionInfo kResolutions[] = {
  {"1m",  60000},
  {"5m",  300000},
  {"15m", 900000},
  {"30m", 1800000},
  {"1H",  3600000},
  {"4H",  14400000},
  {"1D",  86400000},
  {"1W",  604800000},
};

inline constexpr int kResolutionCount =
    static_cast<int>(sizeof(kResolutions) / sizeof(kResolutions[0]));

// Duration of a resolution in ms, 0 if unknown. Accepts loose keys ("1h").
std::int64_t resolutionMs(const std::string& resolution);

// Position in the canonical 1m..1W order, -1 if unknown.
int canonicalIndex(const std::string& resolution);

// Bucket start for a timestamp.
inline std::int64_t bucketStart(std::int64_t ts, std::int64_t durationMs) {
  if (durationMs <= 0) return ts;
  std::int64_t q = ts / durationMs;
  if (ts < 0 && q * durationMs != ts) q -= 1;
  return q * durationMs;
}

// "1h" -> "1H", "15 m" -> "15m", "1d" -> "1D". Unmatched input is returned trimmed.
std::string normalizeTimeframeKey(const std::string& value);

} // namespace mtc
