#include "mtc/frames/FrameManager.hpp"
#include "mtc/data/Resolution.hpp"

#include <algorithm>

namespace mtc {

FrameManager::FrameManager()
  : active_(defaultActiveFrameIds()) {
  ensureActiveStates();
}

void FrameManager::setConfig(const FrameManagerConfig& cfg) {
  config_ = cfg;
  if (config_.maxActiveFrames < 1) config_.maxActiveFrames = 1;
  if (static_cast<int>(active_.size()) > config_.maxActiveFrames) {
    active_.resize(static_cast<std::size_t>(config_.maxActiveFrames));
  }
}

std::vector<const FrameConfig*> FrameManager::activeConfigs() const {
  std::vector<const FrameConfig*> out;
  out.reserve(active_.size());
  for (const auto& id : active_) {
    if (const FrameConfig* f = findFramePreset(id)) out.push_back(f);
  }
  return out;
}

bool FrameManager::isActive(const std::string& id) const {
  return std::find(active_.begin(), active_.end(), id) != active_.end();
}

void FrameManager::sortCanonical(std::vector<std::string>& ids) const {
  std::sort(ids.begin(), ids.end(), [](const std::string& a, const std::string& b) {
    return canonicalIndex(a) < canonicalIndex(b);
  });
}

void FrameManager::ensureActiveStates() {
  for (const auto& id : active_) states_[id];
}

bool FrameManager::toggleFrame(const std::string& id) {
  if (!findFramePreset(id)) return false;

  auto it = std::find(active_.begin(), active_.end(), id);
  if (it != active_.end()) {
    if (active_.size() <= 1) return false;
    active_.erase(it);
    return true;
  }
  if (static_cast<int>(active_.size()) >= config_.maxActiveFrames) return false;
  active_.push_back(id);
  sortCanonical(active_);
  ensureActiveStates();
  return true;
}

bool FrameManager::ensureFrameActive(const std::string& input) {
  std::string id = resolveFrameId(input);
  if (id.empty()) return false;
  if (isActive(id)) return true;

  // At capacity the front (finest) frame goes.
  if (static_cast<int>(active_.size()) >= config_.maxActiveFrames) {
    active_.erase(active_.begin());
  }
  active_.push_back(id);
  sortCanonical(active_);
  ensureActiveStates();
  return true;
}

bool FrameManager::setActiveFrames(const std::vector<std::string>& ids) {
  std::vector<std::string> next;
  for (const auto& raw : ids) {
    std::string id = resolveFrameId(raw);
    if (id.empty()) continue;
    if (std::find(next.begin(), next.end(), id) != next.end()) continue;
    next.push_back(id);
  }
  if (next.empty()) return false;

  sortCanonical(next);
  if (static_cast<int>(next.size()) > config_.maxActiveFrames) {
    next.resize(static_cast<std::size_t>(config_.maxActiveFrames));
  }
  if (next == active_) return false;
  active_ = std::move(next);
  ensureActiveStates();
  return true;
}

FrameState* FrameManager::state(const std::string& id) {
  auto it = states_.find(id);
  return it == states_.end() ? nullptr : &it->second;
}

const FrameState* FrameManager::state(const std::string& id) const {
  auto it = states_.find(id);
  return it == states_.end() ? nullptr : &it->second;
}

FrameState& FrameManager::ensureState(const std::string& id) {
  return states_[id];
}

void FrameManager::resetAll() {
  states_.clear();
  ensureActiveStates();
}

} // namespace mtc
