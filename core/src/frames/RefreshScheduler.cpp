#include "mtc/frames/RefreshScheduler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace mtc {

static constexpr std::int64_t kMinIntervalMs = 250;
static constexpr std::int64_t kMinDelayMs = 100;
static constexpr double kMaxJitter = 0.6;
static constexpr double kHiddenMultiplier = 3.0;

static double priorityMultiplier(TaskPriority p) {
  switch (p) {
    case TaskPriority::Critical: return 1.0;
    case TaskPriority::High:     return 1.0;
    case TaskPriority::Normal:   return 1.15;
    case TaskPriority::Low:      return 1.3;
  }
  return 1.0;
}

RefreshScheduler::RefreshScheduler(std::uint32_t seed) : rng_(seed) {}

std::int64_t RefreshScheduler::withJitter(std::int64_t baseMs, double jitterPct) {
  if (jitterPct <= 0) return std::max(kMinDelayMs, baseMs);
  double spread = static_cast<double>(baseMs) * jitterPct;
  std::uniform_real_distribution<double> dist(-spread, spread);
  auto delay = static_cast<std::int64_t>(std::floor(static_cast<double>(baseMs) + dist(rng_)));
  return std::max(kMinDelayMs, delay);
}

bool RefreshScheduler::canRunNow(const Entry& e) const {
  if (e.stats.paused) return false;
  if (e.task.visibility == VisibilityMode::Foreground && !visible_) return false;
  if (e.task.visibility == VisibilityMode::Background && visible_) return false;
  return true;
}

std::int64_t RefreshScheduler::computeDelay(const Entry& e) {
  double delay = std::floor(static_cast<double>(e.task.intervalMs) * priorityMultiplier(e.task.priority));
  if (e.task.visibility != VisibilityMode::Always && !visible_) {
    delay = std::floor(delay * kHiddenMultiplier);
  }
  return withJitter(static_cast<std::int64_t>(delay), e.task.jitterPct);
}

void RefreshScheduler::registerTask(const SchedulerTask& task, std::int64_t nowMs) {
  if (task.id.empty()) {
    throw std::invalid_argument("RefreshScheduler: task id is required");
  }
  Entry e;
  e.task = task;
  e.task.intervalMs = std::max(kMinIntervalMs, task.intervalMs);
  e.task.jitterPct = std::max(0.0, std::min(kMaxJitter, task.jitterPct));
  e.stats.nextDueMs = nowMs + computeDelay(e);
  tasks_[task.id] = std::move(e);
}

void RefreshScheduler::unregisterTask(const std::string& id) {
  tasks_.erase(id);
}

bool RefreshScheduler::hasTask(const std::string& id) const {
  return tasks_.count(id) != 0;
}

void RefreshScheduler::pause(const std::string& id) {
  auto it = tasks_.find(id);
  if (it != tasks_.end()) it->second.stats.paused = true;
}

void RefreshScheduler::resume(const std::string& id, std::int64_t nowMs) {
  auto it = tasks_.find(id);
  if (it == tasks_.end() || !it->second.stats.paused) return;
  it->second.stats.paused = false;
  it->second.stats.nextDueMs = nowMs + computeDelay(it->second);
}

void RefreshScheduler::rearm(const std::string& id, std::int64_t nowMs) {
  auto it = tasks_.find(id);
  if (it != tasks_.end()) it->second.stats.nextDueMs = nowMs;
}

int RefreshScheduler::advance(std::int64_t nowMs) {
  // Collect first: a task body may register or unregister tasks.
  std::vector<std::string> due;
  for (const auto& [id, e] : tasks_) {
    if (e.stats.nextDueMs <= nowMs) due.push_back(id);
  }
  std::sort(due.begin(), due.end());

  int runs = 0;
  for (const auto& id : due) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) continue;
    Entry& e = it->second;
    if (!canRunNow(e)) {
      e.stats.skipCount++;
      e.stats.nextDueMs = nowMs + computeDelay(e);
      continue;
    }
    std::function<void()> run = e.task.run;
    e.stats.runCount++;
    e.stats.lastRunAtMs = nowMs;
    e.stats.nextDueMs = nowMs + computeDelay(e);
    runs++;
    if (run) run();
  }
  return runs;
}

const SchedulerTaskStats* RefreshScheduler::stats(const std::string& id) const {
  auto it = tasks_.find(id);
  return it == tasks_.end() ? nullptr : &it->second.stats;
}

} // namespace mtc
