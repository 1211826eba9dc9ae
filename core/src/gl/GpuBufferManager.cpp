#include "mtc/gl/GpuBufferManager.hpp"

namespace mtc {

GpuBufferManager::~GpuBufferManager() {
  release();
}

void GpuBufferManager::release() {
  for (auto& e : entries_) {
    if (e.vbo) glDeleteBuffers(1, &e.vbo);
  }
  entries_.clear();
}

GLuint GpuBufferManager::upload(std::uint32_t slot, const void* data, std::size_t bytes) {
  if (bytes == 0 || !data) return 0;
  if (slot >= entries_.size()) entries_.resize(slot + 1);
  Entry& e = entries_[slot];
  if (!e.vbo) glGenBuffers(1, &e.vbo);

  glBindBuffer(GL_ARRAY_BUFFER, e.vbo);
  if (bytes > e.capacity) {
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(bytes), data, GL_STREAM_DRAW);
    e.capacity = bytes;
  } else {
    // Orphan, then fill.
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(e.capacity), nullptr, GL_STREAM_DRAW);
    glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(bytes), data);
  }
  uploaded_ += bytes;
  return e.vbo;
}

} // namespace mtc
