#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

// Static per-resolution frame preset.
struct FrameConfig {
  std::string id;
  std::string label;
  std::string resolution;
  int lookbackBars{0};       // history window to request
  int displayBars{0};        // trailing bars rendered
  std::int64_t maxAgeMs{0};  // staleness budget

  std::size_t capacity() const {
    return static_cast<std::size_t>(lookbackBars > displayBars ? lookbackBars : displayBars);
  }
};

// All presets in canonical 1m..1W order.
const std::vector<FrameConfig>& framePresets();

// Preset by exact id, nullptr if unknown.
const FrameConfig* findFramePreset(const std::string& id);

// Loose timeframe string ("1h", "15 m", "4H") -> preset id, "" if none.
std::string resolveFrameId(const std::string& input);

// 5m, 15m, 1H, 4H
std::vector<std::string> defaultActiveFrameIds();

} // namespace mtc
