#pragma once
#include "mtc/style/Theme.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mtc {

// Batch kinds map 1:1 onto backend pipelines.
enum class BatchKind : std::uint8_t {
  Rects = 0,     // rect4:   x0,y0,x1,y1
  Lines,         // rect4:   x0,y0,x1,y1 segment, lineWidth px
  Candles,       // candle6: cx,open,high,low,close,halfWidth (pixel y)
  Triangles,     // pos2a:   x,y,alpha per vertex
  Text           // runs laid out by the backend
};

std::size_t floatsPerInstance(BatchKind kind);

struct TextRun {
  std::string text;
  float x{0};
  float baselineY{0};
};

struct DrawBatch {
  BatchKind kind{BatchKind::Rects};
  Color color;
  Color colorUp, colorDown, colorWick;   // candles only
  float lineWidth{1};
  float fontPx{10};
  std::vector<float> data;
  std::vector<TextRun> texts;

  std::size_t instanceCount() const;
};

// Backend-neutral draw commands for one surface, in pixel space with y
// down. Consecutive commands with the same style merge into one batch;
// batches are drawn in order.
class DrawList {
public:
  DrawList() = default;
  DrawList(int width, int height) : width_(width), height_(height) {}

  void reset(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }

  void setClearColor(const Color& c) { clear_ = c; }
  const Color& clearColor() const { return clear_; }

  void addRect(float x, float y, float w, float h, const Color& color);
  void addLine(float x0, float y0, float x1, float y1, const Color& color, float width = 1.0f);

  // Split into on/off dashes along the segment.
  void addDashedLine(float x0, float y0, float x1, float y1, const Color& color,
                     float width = 1.0f, float on = 4.0f, float off = 4.0f);

  // Open polyline through (xs[i], ys[i]).
  void addPolyline(const std::vector<float>& xs, const std::vector<float>& ys,
                   const Color& color, float width = 1.0f);

  void addCandle(float cx, float yOpen, float yHigh, float yLow, float yClose,
                 float halfWidth, const Color& up, const Color& down, const Color& wick);

  void addCircle(float cx, float cy, float r, const Color& color, int segments = 16);

  void addText(const std::string& text, float x, float baselineY, float fontPx,
               const Color& color);

  const std::vector<DrawBatch>& batches() const { return batches_; }
  bool empty() const { return batches_.empty(); }

  // Totals across batches, for tests and stats.
  std::size_t instanceCount(BatchKind kind) const;
  std::vector<std::string> texts() const;

private:
  DrawBatch& batchFor(BatchKind kind, const Color& color, float lineWidth, float fontPx);

  int width_{0};
  int height_{0};
  Color clear_{0, 0, 0, 1};
  std::vector<DrawBatch> batches_;
};

} // namespace mtc
