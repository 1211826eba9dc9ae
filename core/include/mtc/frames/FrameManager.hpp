#pragma once
#include "mtc/frames/FrameConfig.hpp"
#include "mtc/frames/FrameState.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace mtc {

struct FrameManagerConfig {
  int maxActiveFrames{5};
};

// Owns the active frame ids (canonically ordered, 1..maxActiveFrames) and the
// per-frame state. Frames keep their state while inactive until resetAll().
class FrameManager {
public:
  FrameManager();

  void setConfig(const FrameManagerConfig& cfg);
  const FrameManagerConfig& config() const { return config_; }

  const std::vector<std::string>& activeIds() const { return active_; }
  std::vector<const FrameConfig*> activeConfigs() const;
  bool isActive(const std::string& id) const;

  // Add or remove one frame. No-op (returns false) if it would leave zero
  // frames, exceed capacity, or the id is unknown.
  bool toggleFrame(const std::string& id);

  // Resolve a loose timeframe and make it active, evicting the oldest active
  // frame when full. Returns false if the input does not resolve.
  bool ensureFrameActive(const std::string& input);

  // Replace the set: resolved, deduplicated, canonically ordered, capped.
  // Returns true if the set changed.
  bool setActiveFrames(const std::vector<std::string>& ids);

  FrameState* state(const std::string& id);
  const FrameState* state(const std::string& id) const;
  FrameState& ensureState(const std::string& id);

  // Drop every frame's state (symbol change).
  void resetAll();

private:
  void sortCanonical(std::vector<std::string>& ids) const;
  void ensureActiveStates();

  FrameManagerConfig config_;
  std::vector<std::string> active_;
  std::unordered_map<std::string, FrameState> states_;
};

} // namespace mtc
