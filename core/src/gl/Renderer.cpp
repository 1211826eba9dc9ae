#include "mtc/gl/Renderer.hpp"
#include "mtc/text/GlyphAtlas.hpp"
#include "mtc/text/TextLayout.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <vector>

namespace mtc {

namespace {

enum BufferSlot : std::uint32_t {
  SlotRects = 0,
  SlotLines,
  SlotCandles,
  SlotTriangles,
  SlotText
};

// ---- rect4 ----

const char* kRectVert = R"GLSL(
#version 330 core
in vec4 a_rect;
uniform mat3 u_transform;
void main() {
    int v = gl_VertexID % 6;
    vec2 uv;
    if (v == 0)      uv = vec2(0.0, 0.0);
    else if (v == 1) uv = vec2(1.0, 0.0);
    else if (v == 2) uv = vec2(0.0, 1.0);
    else if (v == 3) uv = vec2(0.0, 1.0);
    else if (v == 4) uv = vec2(1.0, 0.0);
    else             uv = vec2(1.0, 1.0);
    vec2 p = vec2(mix(a_rect.x, a_rect.z, uv.x), mix(a_rect.y, a_rect.w, uv.y));
    gl_Position = vec4((u_transform * vec3(p, 1.0)).xy, 0.0, 1.0);
}
)GLSL";

const char* kSolidFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
out vec4 outColor;
void main() {
    outColor = u_color;
}
)GLSL";

// ---- line segment with AA fringe, widths in pixels ----

const char* kLineVert = R"GLSL(
#version 330 core
in vec4 a_rect;
uniform mat3 u_transform;
uniform float u_lineWidth;
uniform float u_aaWidth;
out float v_dist;
void main() {
    vec2 p0 = a_rect.xy;
    vec2 p1 = a_rect.zw;
    vec2 dir = p1 - p0;
    float len = length(dir);
    vec2 d = (len > 0.0001) ? dir / len : vec2(1.0, 0.0);
    vec2 perp = vec2(-d.y, d.x);

    float hw = u_lineWidth * 0.5;
    float totalHW = hw + u_aaWidth;

    int vid = gl_VertexID % 6;
    vec2 uv;
    if (vid == 0)      uv = vec2(0.0, -1.0);
    else if (vid == 1) uv = vec2(1.0, -1.0);
    else if (vid == 2) uv = vec2(0.0,  1.0);
    else if (vid == 3) uv = vec2(0.0,  1.0);
    else if (vid == 4) uv = vec2(1.0, -1.0);
    else               uv = vec2(1.0,  1.0);

    vec2 pos = mix(p0, p1, uv.x) + perp * (uv.y * totalHW);
    gl_Position = vec4((u_transform * vec3(pos, 1.0)).xy, 0.0, 1.0);
    v_dist = uv.y * totalHW / max(hw, 0.0001);
}
)GLSL";

const char* kLineFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
uniform float u_fringeEdge;
in float v_dist;
out vec4 outColor;
void main() {
    float a = 1.0 - smoothstep(1.0, u_fringeEdge, abs(v_dist));
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

// ---- candle6: vertices 0-5 wick, 6-11 body (body drawn over wick) ----

const char* kCandleVert = R"GLSL(
#version 330 core
in vec4 a_c0;
in vec2 a_c1;
uniform mat3 u_transform;
flat out int v_kind;
void main() {
    float cx    = a_c0.x;
    float open  = a_c0.y;
    float high  = a_c0.z;
    float low   = a_c0.w;
    float close = a_c1.x;
    float hw    = a_c1.y;

    int vid = gl_VertexID % 12;
    bool isWick = (vid < 6);
    int lid = isWick ? vid : (vid - 6);

    vec2 uv;
    if (lid == 0)      uv = vec2(0.0, 0.0);
    else if (lid == 1) uv = vec2(1.0, 0.0);
    else if (lid == 2) uv = vec2(0.0, 1.0);
    else if (lid == 3) uv = vec2(0.0, 1.0);
    else if (lid == 4) uv = vec2(1.0, 0.0);
    else               uv = vec2(1.0, 1.0);

    vec2 p;
    if (isWick) {
        p = vec2(cx + mix(-0.5, 0.5, uv.x), mix(min(high, low), max(high, low), uv.y));
    } else {
        float top = min(open, close);
        float h = max(1.0, abs(close - open));
        p = vec2(mix(cx - hw, cx + hw, uv.x), top + h * uv.y);
    }
    gl_Position = vec4((u_transform * vec3(p, 1.0)).xy, 0.0, 1.0);
    // Pixel y grows down: a rising bar has close above (smaller y) open.
    v_kind = isWick ? 0 : ((close <= open) ? 1 : 2);
}
)GLSL";

const char* kCandleFrag = R"GLSL(
#version 330 core
uniform vec4 u_colorUp;
uniform vec4 u_colorDown;
uniform vec4 u_colorWick;
flat in int v_kind;
out vec4 outColor;
void main() {
    outColor = (v_kind == 0) ? u_colorWick : ((v_kind == 1) ? u_colorUp : u_colorDown);
}
)GLSL";

// ---- x,y,alpha triangles ----

const char* kTriVert = R"GLSL(
#version 330 core
in vec3 a_pos_alpha;
uniform mat3 u_transform;
out float v_alpha;
void main() {
    gl_Position = vec4((u_transform * vec3(a_pos_alpha.xy, 1.0)).xy, 0.0, 1.0);
    v_alpha = a_pos_alpha.z;
}
)GLSL";

const char* kTriFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
in float v_alpha;
out vec4 outColor;
void main() {
    outColor = vec4(u_color.rgb, u_color.a * v_alpha);
}
)GLSL";

// ---- glyph8 ----

const char* kTextVert = R"GLSL(
#version 330 core
in vec4 a_g0;
in vec4 a_g1;
uniform mat3 u_transform;
out vec2 v_uv;
void main() {
    int vid = gl_VertexID % 6;
    vec2 uv;
    if (vid == 0)      uv = vec2(0.0, 0.0);
    else if (vid == 1) uv = vec2(1.0, 0.0);
    else if (vid == 2) uv = vec2(0.0, 1.0);
    else if (vid == 3) uv = vec2(0.0, 1.0);
    else if (vid == 4) uv = vec2(1.0, 0.0);
    else               uv = vec2(1.0, 1.0);
    vec2 p = vec2(mix(a_g0.x, a_g0.z, uv.x), mix(a_g0.y, a_g0.w, uv.y));
    v_uv = vec2(mix(a_g1.x, a_g1.z, uv.x), mix(a_g1.y, a_g1.w, uv.y));
    gl_Position = vec4((u_transform * vec3(p, 1.0)).xy, 0.0, 1.0);
}
)GLSL";

const char* kTextFrag = R"GLSL(
#version 330 core
uniform sampler2D u_atlas;
uniform vec4 u_color;
uniform float u_pxRange;
in vec2 v_uv;
out vec4 outColor;
void main() {
    float val = texture(u_atlas, v_uv).r;
    // u_pxRange < 0: raw coverage atlas
    float a = (u_pxRange < 0.0) ? val : smoothstep(0.45, 0.55, val);
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

void bindInstanced(GLint loc, int comps, GLsizei stride, std::size_t offset) {
  if (loc < 0) return;
  GLuint l = static_cast<GLuint>(loc);
  glEnableVertexAttribArray(l);
  glVertexAttribPointer(l, comps, GL_FLOAT, GL_FALSE, stride,
                        reinterpret_cast<const void*>(offset));
  glVertexAttribDivisor(l, 1);
}

void unbindInstanced(GLint loc) {
  if (loc < 0) return;
  glVertexAttribDivisor(static_cast<GLuint>(loc), 0);
  glDisableVertexAttribArray(static_cast<GLuint>(loc));
}

} // namespace

Renderer::~Renderer() {
  if (vao_) glDeleteVertexArrays(1, &vao_);
  if (atlasTexture_) glDeleteTextures(1, &atlasTexture_);
}

bool Renderer::init() {
  if (!rectProg_.build("rect", kRectVert, kSolidFrag) ||
      !lineProg_.build("line", kLineVert, kLineFrag) ||
      !candleProg_.build("candle", kCandleVert, kCandleFrag) ||
      !triProg_.build("tri", kTriVert, kTriFrag) ||
      !textProg_.build("text", kTextVert, kTextFrag)) {
    std::fprintf(stderr, "Renderer::init: shader build failed\n");
    return false;
  }
  glGenVertexArrays(1, &vao_);
  glGenTextures(1, &atlasTexture_);
  inited_ = true;
  return true;
}

void Renderer::uploadAtlasIfDirty() {
  if (!atlas_ || !atlas_->isDirty()) return;
  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  GLsizei sz = static_cast<GLsizei>(atlas_->atlasSize());
  glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, sz, sz, 0, GL_RED, GL_UNSIGNED_BYTE, atlas_->atlasData());
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0);
  atlas_->clearDirty();
}

void Renderer::drawRects(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats) {
  GLsizei count = static_cast<GLsizei>(b.instanceCount());
  if (!bufs.upload(SlotRects, b.data.data(), b.data.size() * sizeof(float))) return;

  rectProg_.use();
  rectProg_.setMat3("u_transform", transform_);
  rectProg_.setVec4("u_color", b.color.r, b.color.g, b.color.b, b.color.a);

  GLint aRect = rectProg_.attrib("a_rect");
  bindInstanced(aRect, 4, 16, 0);
  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, count);
  unbindInstanced(aRect);
  stats.drawCalls++;
  stats.instances += static_cast<std::uint32_t>(count);
}

void Renderer::drawLines(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats) {
  GLsizei count = static_cast<GLsizei>(b.instanceCount());
  if (!bufs.upload(SlotLines, b.data.data(), b.data.size() * sizeof(float))) return;

  const float aaWidth = 0.75f;
  float hw = b.lineWidth * 0.5f;
  lineProg_.use();
  lineProg_.setMat3("u_transform", transform_);
  lineProg_.setVec4("u_color", b.color.r, b.color.g, b.color.b, b.color.a);
  lineProg_.setFloat("u_lineWidth", b.lineWidth);
  lineProg_.setFloat("u_aaWidth", aaWidth);
  lineProg_.setFloat("u_fringeEdge", hw > 0.0001f ? (hw + aaWidth) / hw : 2.0f);

  GLint aRect = lineProg_.attrib("a_rect");
  bindInstanced(aRect, 4, 16, 0);
  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, count);
  unbindInstanced(aRect);
  stats.drawCalls++;
  stats.instances += static_cast<std::uint32_t>(count);
}

void Renderer::drawCandles(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats) {
  GLsizei count = static_cast<GLsizei>(b.instanceCount());
  if (!bufs.upload(SlotCandles, b.data.data(), b.data.size() * sizeof(float))) return;

  candleProg_.use();
  candleProg_.setMat3("u_transform", transform_);
  candleProg_.setVec4("u_colorUp", b.colorUp.r, b.colorUp.g, b.colorUp.b, b.colorUp.a);
  candleProg_.setVec4("u_colorDown", b.colorDown.r, b.colorDown.g, b.colorDown.b, b.colorDown.a);
  candleProg_.setVec4("u_colorWick", b.colorWick.r, b.colorWick.g, b.colorWick.b, b.colorWick.a);

  GLint aC0 = candleProg_.attrib("a_c0");
  GLint aC1 = candleProg_.attrib("a_c1");
  bindInstanced(aC0, 4, 24, 0);
  bindInstanced(aC1, 2, 24, 16);
  glDrawArraysInstanced(GL_TRIANGLES, 0, 12, count);
  unbindInstanced(aC0);
  unbindInstanced(aC1);
  stats.drawCalls++;
  stats.instances += static_cast<std::uint32_t>(count);
}

void Renderer::drawTriangles(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats) {
  GLsizei verts = static_cast<GLsizei>(b.instanceCount());
  if (!bufs.upload(SlotTriangles, b.data.data(), b.data.size() * sizeof(float))) return;

  triProg_.use();
  triProg_.setMat3("u_transform", transform_);
  triProg_.setVec4("u_color", b.color.r, b.color.g, b.color.b, b.color.a);

  GLint aPos = triProg_.attrib("a_pos_alpha");
  if (aPos < 0) return;
  glEnableVertexAttribArray(static_cast<GLuint>(aPos));
  glVertexAttribPointer(static_cast<GLuint>(aPos), 3, GL_FLOAT, GL_FALSE, 12, nullptr);
  glDrawArrays(GL_TRIANGLES, 0, verts);
  glDisableVertexAttribArray(static_cast<GLuint>(aPos));
  stats.drawCalls++;
  stats.instances += static_cast<std::uint32_t>(verts / 3);
}

void Renderer::drawText(const DrawBatch& b, GpuBufferManager& bufs, Stats& stats) {
  if (!atlas_ || !atlas_->fontLoaded()) {
    stats.skippedBatches++;
    return;
  }

  std::vector<float> glyphs;
  int count = 0;
  for (const auto& run : b.texts) {
    TextLayoutResult r = layoutText(*atlas_, run.text, run.x, run.baselineY, b.fontPx);
    glyphs.insert(glyphs.end(), r.glyphInstances.begin(), r.glyphInstances.end());
    count += r.glyphCount;
  }
  if (count == 0 || !bufs.upload(SlotText, glyphs.data(), glyphs.size() * sizeof(float))) return;

  textProg_.use();
  textProg_.setMat3("u_transform", transform_);
  textProg_.setVec4("u_color", b.color.r, b.color.g, b.color.b, b.color.a);
  textProg_.setFloat("u_pxRange", atlas_->useSdf() ? static_cast<float>(atlas_->sdfRange()) : -1.0f);

  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  textProg_.setInt("u_atlas", 0);

  GLint aG0 = textProg_.attrib("a_g0");
  GLint aG1 = textProg_.attrib("a_g1");
  bindInstanced(aG0, 4, 32, 0);
  bindInstanced(aG1, 4, 32, 16);
  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, count);
  unbindInstanced(aG0);
  unbindInstanced(aG1);
  glBindTexture(GL_TEXTURE_2D, 0);
  stats.drawCalls++;
  stats.instances += static_cast<std::uint32_t>(count);
}

Stats Renderer::render(const DrawList& list, GpuBufferManager& bufs, int viewX, int viewY) {
  Stats stats{};
  if (!inited_ || list.width() <= 0 || list.height() <= 0) return stats;
  auto t0 = std::chrono::steady_clock::now();
  bufs.resetCounters();

  uploadAtlasIfDirty();

  const float w = static_cast<float>(list.width());
  const float h = static_cast<float>(list.height());
  const float xf[9] = {2.0f / w, 0, 0,
                       0, -2.0f / h, 0,
                       -1.0f, 1.0f, 1.0f};
  std::copy(xf, xf + 9, transform_);

  glViewport(viewX, viewY, list.width(), list.height());
  glEnable(GL_SCISSOR_TEST);
  glScissor(viewX, viewY, list.width(), list.height());
  const Color& cc = list.clearColor();
  glClearColor(cc.r, cc.g, cc.b, cc.a);
  glClear(GL_COLOR_BUFFER_BIT);

  glEnable(GL_BLEND);
  glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA, GL_ONE, GL_ONE_MINUS_SRC_ALPHA);
  glBindVertexArray(vao_);

  for (const auto& b : list.batches()) {
    if (b.instanceCount() == 0) {
      stats.skippedBatches++;
      continue;
    }
    switch (b.kind) {
      case BatchKind::Rects:     drawRects(b, bufs, stats); break;
      case BatchKind::Lines:     drawLines(b, bufs, stats); break;
      case BatchKind::Candles:   drawCandles(b, bufs, stats); break;
      case BatchKind::Triangles: drawTriangles(b, bufs, stats); break;
      case BatchKind::Text:      drawText(b, bufs, stats); break;
    }
  }

  glBindBuffer(GL_ARRAY_BUFFER, 0);
  glBindVertexArray(0);
  glDisable(GL_BLEND);
  glDisable(GL_SCISSOR_TEST);
  glFlush();

  stats.uploadedBytesThisFrame = bufs.uploadedBytes();
  stats.frameMs = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - t0).count();
  return stats;
}

} // namespace mtc
