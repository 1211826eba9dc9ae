#pragma once
#include "mtc/style/Theme.hpp"
#include "mtc/overlay/OverlayLevel.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mtc {

// Externally maintained feeds. The engine only filters them to the focused
// symbol/timeframe. Prices <= 0 mean "not set".

struct Position {
  std::string id;
  std::string symbol;
  std::string type;          // BUY / SELL
  double entryPrice{0};
  double stopLoss{0};
  double takeProfit{0};
};

struct Order {
  std::string id;
  std::string symbol;
  std::string side;          // BUY / SELL
  std::string type;          // market / limit / stop
  double price{0};
  double stopLoss{0};
  double takeProfit{0};
};

struct SetupSignal {
  std::string id;
  std::string symbol;
  std::string timeframe;
  std::int64_t ts{0};
  std::string watcherId;
  std::string strategy;
  std::string status;        // setup_detected, setup_ready, ...
  std::string signalType;    // used when status is empty
  double entryPrice{0};
  double stopLoss{0};
  double takeProfit{0};
  bool hasEntry{false}, hasStop{false}, hasTakeProfit{false};
};

struct PatternEvent {
  std::string id;
  std::string symbol;
  std::string timeframe;
  std::int64_t ts{0};
  std::string type;          // swing_high, fvg_bull, ...
  std::map<std::string, double> payload;   // price, level, high, low, gapHigh, ...
};

struct ReviewLevel {
  double price{0};
  std::string label;         // "" -> "Review"
  Color color;
  bool hasColor{false};
  LevelStyle style{LevelStyle::Solid};
  int priority{22};
};

struct ReviewAnnotation {
  std::string id;
  std::string symbol;
  std::string timeframe;     // "" applies to every frame
  std::int64_t createdAtMs{0};
  std::vector<ReviewLevel> levels;
};

} // namespace mtc
