#include "mtc/math/PriceFormat.hpp"
#include "mtc/math/TimeFormat.hpp"

#include <cmath>
#include <cstdio>

namespace mtc {

std::string formatFixed(double value, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  return buf;
}

std::string formatPrice(double value) {
  if (!std::isfinite(value)) return "--";
  double a = std::fabs(value);
  int decimals = a >= 1000 ? 2 : (a >= 1 ? 4 : 6);
  std::string s = formatFixed(value, decimals);

  std::size_t dot = s.find('.');
  if (dot != std::string::npos) {
    std::size_t end = s.find_last_not_of('0');
    if (end == dot) end--;
    s.resize(end + 1);
  }
  if (s == "-0") s = "0";
  return s;
}

std::string formatAge(std::int64_t updatedAtMs, std::int64_t nowMs) {
  if (updatedAtMs <= 0) return "--";
  std::int64_t delta = nowMs > updatedAtMs ? nowMs - updatedAtMs : 0;
  std::int64_t seconds = delta / 1000;
  if (seconds < 1) seconds = 1;
  if (seconds < 60) return std::to_string(seconds) + "s";
  std::int64_t minutes = seconds / 60;
  if (minutes < 60) return std::to_string(minutes) + "m";
  return std::to_string(minutes / 60) + "h";
}

} // namespace mtc
