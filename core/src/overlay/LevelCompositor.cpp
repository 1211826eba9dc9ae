#include "mtc/overlay/LevelCompositor.hpp"
#include "mtc/data/Resolution.hpp"
#include "mtc/data/Symbols.hpp"
#include "mtc/overlay/PatternLevels.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <unordered_map>
#include <unordered_set>

namespace mtc {

// ---------- toggles ----------

bool OverlayToggles::get(OverlayToggle t) const {
  switch (t) {
    case OverlayToggle::Indicators:  return indicators;
    case OverlayToggle::LiveQuote:   return liveQuote;
    case OverlayToggle::Ranges:      return ranges;
    case OverlayToggle::Setups:      return setups;
    case OverlayToggle::Reviews:     return reviews;
    case OverlayToggle::Patterns:    return patterns;
    case OverlayToggle::Sessions:    return sessions;
    case OverlayToggle::Constraints: return constraints;
    case OverlayToggle::Positions:   return positions;
    case OverlayToggle::Orders:      return orders;
  }
  return false;
}

bool OverlayToggles::set(OverlayToggle t, bool on) {
  bool* slot = nullptr;
  switch (t) {
    case OverlayToggle::Indicators:  slot = &indicators; break;
    case OverlayToggle::LiveQuote:   slot = &liveQuote; break;
    case OverlayToggle::Ranges:      slot = &ranges; break;
    case OverlayToggle::Setups:      slot = &setups; break;
    case OverlayToggle::Reviews:     slot = &reviews; break;
    case OverlayToggle::Patterns:    slot = &patterns; break;
    case OverlayToggle::Sessions:    slot = &sessions; break;
    case OverlayToggle::Constraints: slot = &constraints; break;
    case OverlayToggle::Positions:   slot = &positions; break;
    case OverlayToggle::Orders:      slot = &orders; break;
  }
  if (!slot || *slot == on) return false;
  *slot = on;
  return true;
}

bool parseOverlayToggle(const std::string& name, OverlayToggle& out) {
  static const std::unordered_map<std::string, OverlayToggle> names = {
    {"indicators", OverlayToggle::Indicators},
    {"liveQuote", OverlayToggle::LiveQuote},
    {"ranges", OverlayToggle::Ranges},
    {"setups", OverlayToggle::Setups},
    {"reviews", OverlayToggle::Reviews},
    {"patterns", OverlayToggle::Patterns},
    {"sessions", OverlayToggle::Sessions},
    {"constraints", OverlayToggle::Constraints},
    {"positions", OverlayToggle::Positions},
    {"orders", OverlayToggle::Orders},
  };
  auto it = names.find(name);
  if (it == names.end()) return false;
  out = it->second;
  return true;
}

// ---------- selection ----------

std::string levelDedupKey(const OverlayLevel& level) {
  if (!level.id.empty()) return level.id;
  char price[32];
  std::snprintf(price, sizeof(price), "%.12g", level.price);
  return level.label + ":" + price + ":" + levelKindName(level.kind);
}

LevelList selectLevels(const LevelList& candidates, double priceRange,
                       const LevelSelectionConfig& cfg) {
  LevelList forced;
  LevelList selectable;
  for (const auto& lv : candidates) {
    if (isForcedKind(lv.kind)) {
      forced.push_back(lv);
    } else if (std::isfinite(lv.price)) {
      selectable.push_back(lv);
    }
  }
  std::stable_sort(selectable.begin(), selectable.end(),
                   [](const OverlayLevel& a, const OverlayLevel& b) { return a.priority > b.priority; });

  double tolerance = priceRange * cfg.dedupBandFraction;
  LevelList selected;
  for (const auto& lv : selectable) {
    if (static_cast<int>(selected.size()) >= cfg.maxSelected) break;
    bool near = std::any_of(selected.begin(), selected.end(), [&](const OverlayLevel& s) {
      return std::fabs(s.price - lv.price) < tolerance;
    });
    if (near) continue;
    selected.push_back(lv);
  }

  LevelList out;
  std::unordered_set<std::string> seen;
  for (const LevelList* group : {&forced, &selected}) {
    for (const auto& lv : *group) {
      if (!seen.insert(levelDedupKey(lv)).second) continue;
      out.push_back(lv);
    }
  }
  return out;
}

std::string formatSignalStatus(const std::string& status) {
  if (status == "setup_detected") return "DETECTED";
  if (status == "setup_ready") return "READY";
  if (status == "entry_confirmed") return "CONFIRMED";
  if (status == "triggered") return "TRIGGERED";
  if (status == "invalidated") return "INVALID";
  std::string up = status;
  for (char& c : up) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return up;
}

static std::string resolveSignalStatus(const SetupSignal& s) {
  if (!s.status.empty()) return s.status;
  if (!s.signalType.empty()) return s.signalType;
  return "setup_ready";
}

static std::string upper(std::string s) {
  for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

// ---------- compositor ----------

LevelCompositor::LevelCompositor() : theme_(darkChartTheme()) {}

bool LevelCompositor::setToggle(OverlayToggle t, bool on) {
  if (!toggles_.set(t, on)) return false;
  rebuildBase();
  return true;
}

void LevelCompositor::setSymbol(const std::string& symbol) {
  symbol_ = symbol;
  rebuildBase();
}

void LevelCompositor::setQuotePrice(double price) {
  if (!std::isfinite(price)) return;
  hasQuote_ = true;
  quotePrice_ = price;
  rebuildBase();
}

void LevelCompositor::clearQuote() {
  hasQuote_ = false;
  quotePrice_ = 0;
  rebuildBase();
}

void LevelCompositor::setMinStopDistance(double d) {
  minStopDistance_ = d;
  rebuildBase();
}

void LevelCompositor::setPositions(std::vector<Position> positions) {
  positions_ = std::move(positions);
  rebuildBase();
}

void LevelCompositor::setOrders(std::vector<Order> orders) {
  orders_ = std::move(orders);
  rebuildBase();
}

void LevelCompositor::rebuildBase() {
  base_.clear();
  std::string key = normalizeSymbolKey(symbol_);

  if (hasQuote_) {
    OverlayLevel q;
    q.id = "quote_last";
    q.kind = LevelKind::Quote;
    q.price = quotePrice_;
    q.label = "Last";
    q.color = theme_.last;
    q.priority = 12;
    base_.push_back(q);

    if (toggles_.constraints && std::isfinite(minStopDistance_) && minStopDistance_ > 0) {
      for (int sign : {1, -1}) {
        OverlayLevel c;
        c.kind = LevelKind::Constraint;
        c.price = quotePrice_ + sign * minStopDistance_;
        c.label = sign > 0 ? "MinStop+" : "MinStop-";
        c.color = theme_.constraint;
        c.style = LevelStyle::Dashed;
        c.priority = 4;
        base_.push_back(c);
      }
    }
  }

  if (toggles_.positions) {
    for (const auto& pos : positions_) {
      if (!key.empty() && normalizeSymbolKey(pos.symbol) != key) continue;
      auto make = [&](double price, const char* suffix, LevelField field,
                      const std::string& label, Color color, LevelStyle style,
                      int priority, bool draggable) {
        if (!std::isfinite(price) || price <= 0) return;
        OverlayLevel lv;
        lv.kind = LevelKind::Position;
        lv.price = price;
        lv.label = label;
        lv.color = color;
        lv.style = style;
        lv.priority = priority;
        lv.draggable = draggable;
        if (!pos.id.empty()) {
          lv.id = "pos_" + pos.id + "_" + suffix;
          lv.meta = {LevelEntity::Position, pos.id, field, pos.type, pos.symbol};
        }
        base_.push_back(lv);
      };
      make(pos.entryPrice, "entry", LevelField::Entry, pos.type + " Entry",
           theme_.position, LevelStyle::Solid, 9, false);
      make(pos.stopLoss, "sl", LevelField::Sl, pos.type + " SL",
           theme_.down, LevelStyle::Dashed, 8, true);
      make(pos.takeProfit, "tp", LevelField::Tp, pos.type + " TP",
           theme_.up, LevelStyle::Dashed, 8, true);
    }
  }

  if (toggles_.orders) {
    for (const auto& ord : orders_) {
      if (!key.empty() && normalizeSymbolKey(ord.symbol) != key) continue;
      auto make = [&](double price, const char* suffix, LevelField field,
                      const std::string& label, Color color, LevelStyle style, int priority) {
        if (!std::isfinite(price) || price <= 0) return;
        OverlayLevel lv;
        lv.kind = LevelKind::Order;
        lv.price = price;
        lv.label = label;
        lv.color = color;
        lv.style = style;
        lv.priority = priority;
        lv.draggable = true;
        if (!ord.id.empty()) {
          lv.id = "ord_" + ord.id + "_" + suffix;
          lv.meta = {LevelEntity::Order, ord.id, field, ord.side, ord.symbol};
        }
        base_.push_back(lv);
      };
      make(ord.price, "price", LevelField::Price, upper(ord.type) + " " + ord.side,
           theme_.order, LevelStyle::Solid, 6);
      make(ord.stopLoss, "sl", LevelField::Sl, "Order SL", theme_.down, LevelStyle::Dashed, 5);
      make(ord.takeProfit, "tp", LevelField::Tp, "Order TP", theme_.up, LevelStyle::Dashed, 5);
    }
  }
}

LevelList LevelCompositor::draggableLevels() const {
  LevelList out;
  for (const auto& lv : base_) {
    if (lv.draggable && std::isfinite(lv.price)) out.push_back(lv);
  }
  return out;
}

LevelList LevelCompositor::setupLevels(const FrameConfig& frame) const {
  LevelList out;
  if (!toggles_.setups || signals_.empty()) return out;

  std::string symKey = normalizeSymbolLoose(symbol_);
  std::string tfKey = normalizeTimeframeKey(frame.resolution);

  // Latest signal per watcher; a watcher whose latest signal is invalidated
  // shows nothing.
  std::unordered_map<std::string, const SetupSignal*> latest;
  for (const auto& s : signals_) {
    if (!symKey.empty() && normalizeSymbolLoose(s.symbol) != symKey) continue;
    if (!tfKey.empty() && normalizeTimeframeKey(s.timeframe) != tfKey) continue;
    if (s.watcherId.empty()) continue;
    auto it = latest.find(s.watcherId);
    if (it == latest.end() || s.ts > it->second->ts) latest[s.watcherId] = &s;
  }

  std::vector<const SetupSignal*> recent;
  for (const auto& kv : latest) {
    if (resolveSignalStatus(*kv.second) == "invalidated") continue;
    recent.push_back(kv.second);
  }
  std::sort(recent.begin(), recent.end(), [](const SetupSignal* a, const SetupSignal* b) {
    if (a->ts != b->ts) return a->ts > b->ts;
    return a->watcherId < b->watcherId;
  });
  if (recent.size() > 2) recent.resize(2);

  for (const SetupSignal* s : recent) {
    std::string strategy = s->strategy;
    std::replace(strategy.begin(), strategy.end(), '_', ' ');
    std::string base = "Setup " + strategy + " " + formatSignalStatus(resolveSignalStatus(*s));

    auto push = [&](bool has, double price, const char* suffix, Color color,
                    LevelStyle style, int priority) {
      if (!has || !std::isfinite(price)) return;
      OverlayLevel lv;
      lv.kind = LevelKind::Setup;
      lv.price = price;
      lv.label = base + " " + suffix;
      lv.color = color;
      lv.style = style;
      lv.priority = priority;
      out.push_back(lv);
    };
    push(s->hasEntry, s->entryPrice, "entry", theme_.setupEntry, LevelStyle::Solid, 20);
    push(s->hasStop, s->stopLoss, "sl", theme_.setupStop, LevelStyle::Dashed, 18);
    push(s->hasTakeProfit, s->takeProfit, "tp", theme_.setupTp, LevelStyle::Dashed, 18);
  }
  return out;
}

LevelList LevelCompositor::reviewLevels(const FrameConfig& frame) const {
  LevelList out;
  if (!toggles_.reviews) return out;

  std::string symKey = normalizeSymbolLoose(symbol_);
  std::string tfKey = normalizeTimeframeKey(frame.resolution);
  for (const auto& ann : reviews_) {
    if (!symKey.empty() && normalizeSymbolLoose(ann.symbol) != symKey) continue;
    if (!ann.timeframe.empty() && !tfKey.empty() && normalizeTimeframeKey(ann.timeframe) != tfKey) continue;
    for (const auto& rl : ann.levels) {
      if (!std::isfinite(rl.price)) continue;
      OverlayLevel lv;
      lv.kind = LevelKind::Review;
      lv.price = rl.price;
      lv.label = rl.label.empty() ? "Review" : rl.label;
      lv.color = rl.hasColor ? rl.color : theme_.setupEntry;
      lv.style = rl.style;
      lv.priority = rl.priority;
      out.push_back(lv);
    }
  }
  return out;
}

LevelList LevelCompositor::patternLevels(const FrameConfig& frame, const CandleSeries& visible) const {
  LevelList out;
  if (!toggles_.patterns || patterns_.empty()) return out;

  std::string symKey = normalizeSymbolLoose(symbol_);
  std::string tfKey = normalizeTimeframeKey(frame.resolution);
  bool bounded = !visible.empty();
  std::int64_t minTs = bounded ? visible.front().t : 0;
  std::int64_t maxTs = bounded ? visible.back().t : 0;

  std::vector<const PatternEvent*> matches;
  for (const auto& ev : patterns_) {
    if (ev.type.empty()) continue;
    if (!symKey.empty() && normalizeSymbolLoose(ev.symbol) != symKey) continue;
    if (!tfKey.empty() && normalizeTimeframeKey(ev.timeframe) != tfKey) continue;
    if (bounded && (ev.ts < minTs || ev.ts > maxTs)) continue;
    matches.push_back(&ev);
  }
  std::stable_sort(matches.begin(), matches.end(),
                   [](const PatternEvent* a, const PatternEvent* b) { return a->ts > b->ts; });
  if (matches.size() > 24) matches.resize(24);

  // Newest event per type, at most 8 types.
  std::vector<const PatternEvent*> picked;
  std::unordered_set<std::string> types;
  for (const PatternEvent* ev : matches) {
    if (!types.insert(ev->type).second) continue;
    picked.push_back(ev);
    if (picked.size() >= 8) break;
  }
  for (const PatternEvent* ev : picked) {
    LevelList lv = buildPatternLevels(*ev, theme_);
    out.insert(out.end(), lv.begin(), lv.end());
  }
  return out;
}

LevelList LevelCompositor::pricedLevels(const FrameConfig& frame, const CandleSeries& visible) const {
  LevelList out = base_;
  for (LevelList part : {setupLevels(frame), reviewLevels(frame), patternLevels(frame, visible)}) {
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

LevelList LevelCompositor::finalize(LevelList levels, const CandleSeries& visible,
                                    const std::vector<SessionBlock>& blocks,
                                    const OverlayLevel* dragPreview, double priceRange) const {
  if (dragPreview && std::isfinite(dragPreview->price)) levels.push_back(*dragPreview);

  auto push = [&](double price, const std::string& label, Color color, LevelKind kind, int priority) {
    if (!std::isfinite(price)) return;
    OverlayLevel lv;
    lv.kind = kind;
    lv.price = price;
    lv.label = label;
    lv.color = color;
    lv.style = LevelStyle::Dashed;
    lv.priority = priority;
    levels.push_back(lv);
  };

  if (toggles_.ranges && visible.size() > 5) {
    std::size_t lookback = std::min<std::size_t>(50, visible.size());
    double hi = visible[visible.size() - lookback].h;
    double lo = visible[visible.size() - lookback].l;
    for (std::size_t i = visible.size() - lookback; i < visible.size(); i++) {
      hi = std::max(hi, visible[i].h);
      lo = std::min(lo, visible[i].l);
    }
    push(hi, "Range H", theme_.range, LevelKind::Range, 3);
    push(lo, "Range L", theme_.range, LevelKind::Range, 3);
  }

  if (toggles_.sessions && !blocks.empty()) {
    const SessionBlock& last = blocks.back();
    if (last.style && last.endIndex - last.startIndex + 1 >= 3 &&
        last.endIndex < static_cast<int>(visible.size())) {
      double hi = visible[static_cast<std::size_t>(last.startIndex)].h;
      double lo = visible[static_cast<std::size_t>(last.startIndex)].l;
      for (int i = last.startIndex; i <= last.endIndex; i++) {
        hi = std::max(hi, visible[static_cast<std::size_t>(i)].h);
        lo = std::min(lo, visible[static_cast<std::size_t>(i)].l);
      }
      push(hi, last.style->label + " H", last.style->line, LevelKind::Session, 2);
      push(lo, last.style->label + " L", last.style->line, LevelKind::Session, 2);
    }
  }

  bool hasLast = std::any_of(levels.begin(), levels.end(),
                             [](const OverlayLevel& lv) { return lv.label == "Last"; });
  if (!hasLast && !visible.empty() && std::isfinite(visible.back().c)) {
    OverlayLevel close;
    close.kind = LevelKind::Close;
    close.price = visible.back().c;
    close.label = "Close";
    close.color = theme_.last;
    close.priority = 7;
    levels.push_back(close);
  }

  return selectLevels(levels, priceRange, selection_);
}

} // namespace mtc
