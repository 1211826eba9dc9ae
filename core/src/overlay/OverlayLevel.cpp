#include "mtc/overlay/OverlayLevel.hpp"

namespace mtc {

const char* levelKindName(LevelKind kind) {
  switch (kind) {
    case LevelKind::Quote:      return "quote";
    case LevelKind::Constraint: return "constraint";
    case LevelKind::Position:   return "position";
    case LevelKind::Order:      return "order";
    case LevelKind::Setup:      return "setup";
    case LevelKind::Review:     return "review";
    case LevelKind::Pattern:    return "pattern";
    case LevelKind::Range:      return "range";
    case LevelKind::Session:    return "session";
    case LevelKind::Close:      return "close";
    case LevelKind::Drag:       return "drag";
  }
  return "";
}

const char* levelFieldName(LevelField field) {
  switch (field) {
    case LevelField::None:  return "";
    case LevelField::Entry: return "entry";
    case LevelField::Sl:    return "sl";
    case LevelField::Tp:    return "tp";
    case LevelField::Price: return "price";
  }
  return "";
}

} // namespace mtc
