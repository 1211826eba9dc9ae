#pragma once
#include "mtc/render/Image.hpp"
#include "mtc/style/Theme.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

class GlyphAtlas;

struct SnapshotLayout {
  int headerH{28};
  int labelH{18};
  int gap{12};
  int sidePad{10};
  int bottomPad{6};
  float titlePx{13};
  float labelPx{10};
};

// One rendered frame canvas and the facts for its label line.
struct SnapshotEntry {
  std::string label;
  std::size_t bars{0};
  std::int64_t updatedAtMs{0};
  const Image* image{nullptr};
};

// Stacks frame canvases vertically under a title header. Frames without
// bars or pixels are left out.
class SnapshotComposer {
public:
  SnapshotComposer();

  void setLayout(const SnapshotLayout& layout) { layout_ = layout; }
  const SnapshotLayout& layout() const { return layout_; }
  void setTheme(const ChartTheme& theme) { theme_ = theme; }
  void setBackground(const Color& c) { background_ = c; }

  // Text is skipped when null or without a font.
  void setGlyphAtlas(const GlyphAtlas* atlas) { atlas_ = atlas; }

  // Returns false, leaving out untouched, when nothing is capturable.
  bool compose(const std::string& symbol, const std::vector<SnapshotEntry>& entries,
               std::int64_t nowMs, Image& out) const;

  // Height compose() produces for these canvas heights.
  int composedHeight(const std::vector<int>& canvasHeights) const;

private:
  SnapshotLayout layout_;
  ChartTheme theme_;
  Color background_;
  const GlyphAtlas* atlas_{nullptr};
};

// "Native Chart EURUSD" header title.
std::string snapshotTitle(const std::string& symbol);

// "5m | 240 bars | updated 12s"
std::string snapshotFrameLine(const SnapshotEntry& entry, std::int64_t nowMs);

} // namespace mtc
