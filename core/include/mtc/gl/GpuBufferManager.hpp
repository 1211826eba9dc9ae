#pragma once
#include <glad/gl.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace mtc {

// One streaming VBO per slot, grown on demand and refilled every draw.
class GpuBufferManager {
public:
  GpuBufferManager() = default;
  ~GpuBufferManager();

  GpuBufferManager(const GpuBufferManager&) = delete;
  GpuBufferManager& operator=(const GpuBufferManager&) = delete;

  // Upload bytes into the slot's buffer and leave it bound to
  // GL_ARRAY_BUFFER. Returns the GL name (0 for empty data).
  GLuint upload(std::uint32_t slot, const void* data, std::size_t bytes);

  std::uint64_t uploadedBytes() const { return uploaded_; }
  void resetCounters() { uploaded_ = 0; }

  void release();

private:
  struct Entry {
    GLuint vbo{0};
    std::size_t capacity{0};
  };
  std::vector<Entry> entries_;
  std::uint64_t uploaded_{0};
};

} // namespace mtc
