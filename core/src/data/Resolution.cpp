#include "mtc/data/Resolution.hpp"

#include <cctype>

namespace mtc {

static std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
  return s.substr(b, e - b);
}

std::string normalizeTimeframeKey(const std::string& value) {
  std::string raw = trim(value);
  if (raw.empty()) return raw;

  // ^(\d+)\s*([a-zA-Z]+)$
  std::size_t i = 0;
  while (i < raw.size() && std::isdigit(static_cast<unsigned char>(raw[i]))) i++;
  if (i == 0) return raw;
  std::string amount = raw.substr(0, i);
  while (i < raw.size() && std::isspace(static_cast<unsigned char>(raw[i]))) i++;
  std::size_t unitStart = i;
  while (i < raw.size() && std::isalpha(static_cast<unsigned char>(raw[i]))) i++;
  if (unitStart == i || i != raw.size()) return raw;

  std::string unit = raw.substr(unitStart);
  for (auto& ch : unit) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (unit == "h" || unit == "d" || unit == "w") {
    return amount + static_cast<char>(std::toupper(static_cast<unsigned char>(unit[0])));
  }
  if (unit == "m") return amount + "m";
  return raw;
}

int canonicalIndex(const std::string& resolution) {
  std::string key = normalizeTimeframeKey(resolution);
  for (int i = 0; i < kResolutionCount; i++) {
    if (key == kResolutions[i].key) return i;
  }
  return -1;
}

std::int64_t resolutionMs(const std::string& resolution) {
  int idx = canonicalIndex(resolution);
  return idx < 0 ? 0 : kResolutions[idx].durationMs;
}

} // namespace mtc
