#pragma once
#include <cstdint>

namespace mtc {

// Per-render counters from the GL backend.
struct Stats {
  double frameMs = 0.0;
  std::uint32_t drawCalls = 0;
  std::uint32_t skippedBatches = 0;   // empty or fully off-surface
  std::uint32_t instances = 0;
  std::uint64_t uploadedBytesThisFrame = 0;
};

} // namespace mtc
