#pragma once
#include "mtc/data/Candle.hpp"
#include "mtc/frames/FrameConfig.hpp"
#include "mtc/overlay/Feeds.hpp"
#include "mtc/overlay/OverlayLevel.hpp"
#include "mtc/overlay/Sessions.hpp"
#include "mtc/style/Theme.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

enum class OverlayToggle : std::uint8_t {
  Indicators = 0,
  LiveQuote,
  Ranges,
  Setups,
  Reviews,
  Patterns,
  Sessions,
  Constraints,
  Positions,
  Orders
};

struct OverlayToggles {
  bool indicators{true};
  bool liveQuote{true};
  bool ranges{true};
  bool setups{true};
  bool reviews{true};
  bool patterns{true};
  bool sessions{true};
  bool constraints{true};
  bool positions{true};
  bool orders{true};

  bool get(OverlayToggle t) const;
  // Returns true if the value changed.
  bool set(OverlayToggle t, bool on);
};

// Parse "indicators", "liveQuote", ... Returns false for unknown names.
bool parseOverlayToggle(const std::string& name, OverlayToggle& out);

struct LevelSelectionConfig {
  double dedupBandFraction{0.003};   // of the padded price range
  int maxSelected{6};                // non-forced levels
};

// Forced levels (position/order/drag) plus up to maxSelected others, taken
// by descending priority and skipping any within the dedup band of an
// accepted one. Identical levels (same id, or label:price:kind) appear once.
LevelList selectLevels(const LevelList& candidates, double priceRange,
                       const LevelSelectionConfig& cfg);

// "pos_7_sl" style key used to collapse duplicates.
std::string levelDedupKey(const OverlayLevel& level);

// "setup_ready" -> "READY", unknown -> upper-cased.
std::string formatSignalStatus(const std::string& status);

// Derives the per-frame overlay level set from the quote and the external
// feeds. Two passes per frame: pricedLevels() feeds the plot geometry, then
// finalize() adds bar-derived levels and runs the selection.
class LevelCompositor {
public:
  LevelCompositor();

  void setTheme(const ChartTheme& theme) { theme_ = theme; rebuildBase(); }
  const ChartTheme& theme() const { return theme_; }
  void setSelectionConfig(const LevelSelectionConfig& cfg) { selection_ = cfg; }
  const LevelSelectionConfig& selectionConfig() const { return selection_; }

  const OverlayToggles& toggles() const { return toggles_; }
  bool setToggle(OverlayToggle t, bool on);

  void setSymbol(const std::string& symbol);
  const std::string& symbol() const { return symbol_; }

  void setQuotePrice(double price);
  void clearQuote();
  bool hasQuotePrice() const { return hasQuote_; }
  double quotePrice() const { return quotePrice_; }

  void setMinStopDistance(double d);

  void setPositions(std::vector<Position> positions);
  void setOrders(std::vector<Order> orders);
  void setSetupSignals(std::vector<SetupSignal> signals) { signals_ = std::move(signals); }
  void setPatternEvents(std::vector<PatternEvent> events) { patterns_ = std::move(events); }
  void setReviewAnnotations(std::vector<ReviewAnnotation> reviews) { reviews_ = std::move(reviews); }

  // Quote, constraint, position and order levels. Frame independent.
  const LevelList& baseLevels() const { return base_; }
  LevelList draggableLevels() const;

  LevelList setupLevels(const FrameConfig& frame) const;
  LevelList reviewLevels(const FrameConfig& frame) const;
  LevelList patternLevels(const FrameConfig& frame, const CandleSeries& visible) const;

  // Base + setup + review + pattern levels. These widen the price range.
  LevelList pricedLevels(const FrameConfig& frame, const CandleSeries& visible) const;

  // Adds drag preview, range, session and close-fallback levels to the
  // priced set and selects what gets drawn.
  LevelList finalize(LevelList candidates, const CandleSeries& visible,
                     const std::vector<SessionBlock>& blocks,
                     const OverlayLevel* dragPreview, double priceRange) const;

private:
  void rebuildBase();

  ChartTheme theme_;
  LevelSelectionConfig selection_;
  OverlayToggles toggles_;

  std::string symbol_;
  bool hasQuote_{false};
  double quotePrice_{0};
  double minStopDistance_{0};

  std::vector<Position> positions_;
  std::vector<Order> orders_;
  std::vector<SetupSignal> signals_;
  std::vector<PatternEvent> patterns_;
  std::vector<ReviewAnnotation> reviews_;

  LevelList base_;
};

} // namespace mtc
