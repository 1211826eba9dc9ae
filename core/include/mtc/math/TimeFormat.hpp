#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace mtc {

// Axis label format for a resolution: dates for 4H/1D, clock time otherwise.
inline const char* timeLabelFormat(const std::string& resolution) {
  if (resolution == "4H" || resolution == "1D") return "%b %d";   // Jan 15
  return "%H:%M";                                                  // 14:30
}

// Format an epoch-milliseconds timestamp using strftime.
inline std::string formatTimestampMs(std::int64_t epochMs, const char* fmt, bool utc = true) {
  auto epoch = static_cast<std::time_t>(epochMs / 1000);
  std::tm tm;
  if (utc) {
#ifdef _WIN32
    gmtime_s(&tm, &epoch);
#else
    gmtime_r(&epoch, &tm);
#endif
  } else {
#ifdef _WIN32
    localtime_s(&tm, &epoch);
#else
    localtime_r(&epoch, &tm);
#endif
  }
  char buf[64];
  std::strftime(buf, sizeof(buf), fmt, &tm);
  return buf;
}

// UTC hour of day (0..23) for an epoch-milliseconds timestamp.
inline int utcHourOfDay(std::int64_t epochMs) {
  std::int64_t ms = epochMs % 86400000;
  if (ms < 0) ms += 86400000;
  return static_cast<int>(ms / 3600000);
}

// UTC day number (days since epoch).
inline std::int64_t utcDayIndex(std::int64_t epochMs) {
  std::int64_t d = epochMs / 86400000;
  if (epochMs < 0 && d * 86400000 != epochMs) d -= 1;
  return d;
}

// "12s", "5m", "3h"; "--" for a missing timestamp.
std::string formatAge(std::int64_t updatedAtMs, std::int64_t nowMs);

} // namespace mtc
