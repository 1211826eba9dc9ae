#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

// Engine tuning. Defaults are the empirical UI values the chart was tuned
// with; keep them named rather than re-deriving them.
struct EngineConfig {
  double hitTolerancePx{6};
  double dedupBandFraction{0.003};
  double dragConfirmPx{2};
  int maxSelectedLevels{6};
  std::int64_t refreshIntervalMs{15000};
  double refreshJitter{0.08};
  int maxActiveFrames{5};
  std::int64_t quoteRepeatWindowMs{1000};
  std::int64_t quoteMinIntervalMs{200};
  std::int64_t liveMarkerFreshMs{5000};
  std::string brokerLabel{"broker"};
  std::string fontPath;
  std::vector<std::string> activeFrames;   // empty = 5m, 15m, 1H, 4H
};

// Override fields present in a JSON object. Out-of-range or mistyped
// values are skipped one by one. Returns false only if the text is not a
// JSON object.
bool loadEngineConfig(const std::string& json, EngineConfig& cfg);

bool loadEngineConfigFile(const std::string& path, EngineConfig& cfg);

std::string engineConfigToJson(const EngineConfig& cfg);

} // namespace mtc
