#include "mtc/export/SnapshotComposer.hpp"
#include "mtc/math/TimeFormat.hpp"
#include "mtc/text/GlyphAtlas.hpp"
#include "mtc/text/TextRaster.hpp"

#include <algorithm>
#include <utility>

namespace mtc {

SnapshotComposer::SnapshotComposer()
  : theme_(darkChartTheme()), background_(cssColor("#050505")) {}

std::string snapshotTitle(const std::string& symbol) {
  return symbol.empty() ? "Native Chart" : "Native Chart " + symbol;
}

std::string snapshotFrameLine(const SnapshotEntry& entry, std::int64_t nowMs) {
  return entry.label + " | " + std::to_string(entry.bars) + " bars | updated " +
         formatAge(entry.updatedAtMs, nowMs);
}

int SnapshotComposer::composedHeight(const std::vector<int>& canvasHeights) const {
  if (canvasHeights.empty()) return 0;
  int h = layout_.headerH + layout_.bottomPad;
  for (int ch : canvasHeights) h += layout_.labelH + ch;
  h += layout_.gap * static_cast<int>(canvasHeights.size() - 1);
  return h;
}

bool SnapshotComposer::compose(const std::string& symbol, const std::vector<SnapshotEntry>& entries,
                               std::int64_t nowMs, Image& out) const {
  std::vector<const SnapshotEntry*> keep;
  for (const auto& e : entries) {
    if (e.bars == 0 || !e.image || e.image->empty()) continue;
    keep.push_back(&e);
  }
  if (keep.empty()) return false;

  int maxW = 0;
  std::vector<int> heights;
  for (const auto* e : keep) {
    maxW = std::max(maxW, e->image->width);
    heights.push_back(e->image->height);
  }
  const int width = maxW + layout_.sidePad * 2;
  const int height = composedHeight(heights);

  Image img;
  img.resize(width, height, background_);

  const bool text = atlas_ && atlas_->fontLoaded();
  if (text) {
    rasterText(img, *atlas_, snapshotTitle(symbol), 12, 18, layout_.titlePx, theme_.text);
    rasterText(img, *atlas_, formatTimestampMs(nowMs, "%H:%M:%S"),
               static_cast<float>(width - 120), 18, layout_.labelPx, theme_.textDim);
  }

  int y = layout_.headerH;
  for (const auto* e : keep) {
    if (text) {
      rasterText(img, *atlas_, snapshotFrameLine(*e, nowMs), 12,
                 static_cast<float>(y + 12), layout_.labelPx, theme_.textDim);
    }
    y += layout_.labelH;
    img.blit(*e->image, (width - e->image->width) / 2, y);
    y += e->image->height + layout_.gap;
  }

  out = std::move(img);
  return true;
}

} // namespace mtc
