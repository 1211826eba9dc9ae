#pragma once
#include "mtc/style/Theme.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

enum class LevelKind : std::uint8_t {
  Quote = 0,
  Constraint,
  Position,
  Order,
  Setup,
  Review,
  Pattern,
  Range,
  Session,
  Close,
  Drag
};

enum class LevelStyle : std::uint8_t { Solid = 0, Dashed };

enum class LevelEntity : std::uint8_t { None = 0, Position, Order };

// Which price of a position/order a level edits.
enum class LevelField : std::uint8_t { None = 0, Entry, Sl, Tp, Price };

struct LevelMeta {
  LevelEntity entity{LevelEntity::None};
  std::string id;
  LevelField field{LevelField::None};
  std::string side;
  std::string symbol;
};

// Horizontal priced line. Recomputed every render, never persisted.
struct OverlayLevel {
  std::string id;              // may be empty
  LevelKind kind{LevelKind::Quote};
  double price{0};
  std::string label;
  Color color;
  LevelStyle style{LevelStyle::Solid};
  int priority{0};
  bool draggable{false};
  LevelMeta meta;
};

using LevelList = std::vector<OverlayLevel>;

const char* levelKindName(LevelKind kind);
const char* levelFieldName(LevelField field);

// Forced levels bypass ranking and the selection cap.
inline bool isForcedKind(LevelKind kind) {
  return kind == LevelKind::Position || kind == LevelKind::Order || kind == LevelKind::Drag;
}

} // namespace mtc
