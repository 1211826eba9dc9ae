#include "mtc/render/DrawList.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace mtc {

static bool sameColor(const Color& a, const Color& b) {
  return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

std::size_t floatsPerInstance(BatchKind kind) {
  switch (kind) {
    case BatchKind::Rects:     return 4;
    case BatchKind::Lines:     return 4;
    case BatchKind::Candles:   return 6;
    case BatchKind::Triangles: return 3;
    case BatchKind::Text:      return 0;
  }
  return 0;
}

std::size_t DrawBatch::instanceCount() const {
  if (kind == BatchKind::Text) return texts.size();
  std::size_t n = floatsPerInstance(kind);
  return n ? data.size() / n : 0;
}

void DrawList::reset(int width, int height) {
  width_ = width;
  height_ = height;
  batches_.clear();
}

DrawBatch& DrawList::batchFor(BatchKind kind, const Color& color, float lineWidth, float fontPx) {
  if (!batches_.empty()) {
    DrawBatch& b = batches_.back();
    if (b.kind == kind && sameColor(b.color, color) &&
        b.lineWidth == lineWidth && b.fontPx == fontPx) {
      return b;
    }
  }
  DrawBatch b;
  b.kind = kind;
  b.color = color;
  b.lineWidth = lineWidth;
  b.fontPx = fontPx;
  batches_.push_back(std::move(b));
  return batches_.back();
}

void DrawList::addRect(float x, float y, float w, float h, const Color& color) {
  if (w <= 0 || h <= 0) return;
  DrawBatch& b = batchFor(BatchKind::Rects, color, 1.0f, 0.0f);
  b.data.insert(b.data.end(), {x, y, x + w, y + h});
}

void DrawList::addLine(float x0, float y0, float x1, float y1, const Color& color, float width) {
  DrawBatch& b = batchFor(BatchKind::Lines, color, width, 0.0f);
  b.data.insert(b.data.end(), {x0, y0, x1, y1});
}

void DrawList::addDashedLine(float x0, float y0, float x1, float y1, const Color& color,
                             float width, float on, float off) {
  float dx = x1 - x0;
  float dy = y1 - y0;
  float len = std::sqrt(dx * dx + dy * dy);
  if (len <= 0 || on <= 0) return;
  float ux = dx / len;
  float uy = dy / len;
  for (float pos = 0; pos < len; pos += on + off) {
    float end = std::min(len, pos + on);
    addLine(x0 + ux * pos, y0 + uy * pos, x0 + ux * end, y0 + uy * end, color, width);
  }
}

void DrawList::addPolyline(const std::vector<float>& xs, const std::vector<float>& ys,
                           const Color& color, float width) {
  std::size_t n = std::min(xs.size(), ys.size());
  for (std::size_t i = 1; i < n; i++) {
    addLine(xs[i - 1], ys[i - 1], xs[i], ys[i], color, width);
  }
}

void DrawList::addCandle(float cx, float yOpen, float yHigh, float yLow, float yClose,
                         float halfWidth, const Color& up, const Color& down, const Color& wick) {
  DrawBatch* b = nullptr;
  if (!batches_.empty()) {
    DrawBatch& last = batches_.back();
    if (last.kind == BatchKind::Candles && sameColor(last.colorUp, up) &&
        sameColor(last.colorDown, down) && sameColor(last.colorWick, wick)) {
      b = &last;
    }
  }
  if (!b) {
    DrawBatch nb;
    nb.kind = BatchKind::Candles;
    nb.colorUp = up;
    nb.colorDown = down;
    nb.colorWick = wick;
    batches_.push_back(std::move(nb));
    b = &batches_.back();
  }
  b->data.insert(b->data.end(), {cx, yOpen, yHigh, yLow, yClose, halfWidth});
}

void DrawList::addCircle(float cx, float cy, float r, const Color& color, int segments) {
  if (r <= 0 || segments < 3) return;
  DrawBatch& b = batchFor(BatchKind::Triangles, color, 1.0f, 0.0f);
  const float step = 6.28318530718f / static_cast<float>(segments);
  for (int i = 0; i < segments; i++) {
    float a0 = step * static_cast<float>(i);
    float a1 = step * static_cast<float>(i + 1);
    b.data.insert(b.data.end(), {
      cx, cy, 1.0f,
      cx + r * std::cos(a0), cy + r * std::sin(a0), 1.0f,
      cx + r * std::cos(a1), cy + r * std::sin(a1), 1.0f,
    });
  }
}

void DrawList::addText(const std::string& text, float x, float baselineY, float fontPx,
                       const Color& color) {
  if (text.empty()) return;
  DrawBatch& b = batchFor(BatchKind::Text, color, 1.0f, fontPx);
  b.texts.push_back({text, x, baselineY});
}

std::size_t DrawList::instanceCount(BatchKind kind) const {
  std::size_t n = 0;
  for (const auto& b : batches_) {
    if (b.kind == kind) n += b.instanceCount();
  }
  return n;
}

std::vector<std::string> DrawList::texts() const {
  std::vector<std::string> out;
  for (const auto& b : batches_) {
    for (const auto& t : b.texts) out.push_back(t.text);
  }
  return out;
}

} // namespace mtc
