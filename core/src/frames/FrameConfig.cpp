#include "mtc/frames/FrameConfig.hpp"
#include "mtc/data/Resolution.hpp"

namespace mtc {

const std::vector<FrameConfig>& framePresets() {
  static const std::vector<FrameConfig> presets = {
    {"1m",  "1m",  "1m",  800, 300, 12000},
    {"5m",  "5m",  "5m",  600, 260, 18000},
    {"15m", "15m", "15m", 500, 240, 30000},
    {"30m", "30m", "30m", 420, 220, 35000},
    {"1H",  "1H",  "1H",  360, 200, 45000},
    {"4H",  "4H",  "4H",  240, 160, 60000},
    {"1D",  "1D",  "1D",  180, 120, 90000},
    {"1W",  "1W",  "1W",  120,  80, 120000},
  };
  return presets;
}

const FrameConfig* findFramePreset(const std::string& id) {
  for (const auto& f : framePresets()) {
    if (f.id == id) return &f;
  }
  return nullptr;
}

std::string resolveFrameId(const std::string& input) {
  std::string key = normalizeTimeframeKey(input);
  if (key.empty()) return "";
  if (const FrameConfig* direct = findFramePreset(key)) return direct->id;
  for (const auto& f : framePresets()) {
    if (normalizeTimeframeKey(f.id) == key ||
        normalizeTimeframeKey(f.resolution) == key ||
        normalizeTimeframeKey(f.label) == key) {
      return f.id;
    }
  }
  return "";
}

std::vector<std::string> defaultActiveFrameIds() {
  return {"5m", "15m", "1H", "4H"};
}

} // namespace mtc
