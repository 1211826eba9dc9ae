#pragma once
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <unordered_map>

namespace mtc {

enum class VisibilityMode : std::uint8_t {
  Always = 0,
  Foreground,   // runs only while the view is visible
  Background    // runs only while hidden
};

enum class TaskPriority : std::uint8_t {
  Critical = 0,
  High,
  Normal,
  Low
};

struct SchedulerTask {
  std::string id;
  std::int64_t intervalMs{15000};
  double jitterPct{0.12};
  VisibilityMode visibility{VisibilityMode::Always};
  TaskPriority priority{TaskPriority::Normal};
  std::function<void()> run;
};

struct SchedulerTaskStats {
  std::uint32_t runCount{0};
  std::uint32_t skipCount{0};      // due while gated by visibility or pause
  std::int64_t lastRunAtMs{0};
  std::int64_t nextDueMs{0};
  bool paused{false};
};

// Tick-driven recurring task scheduler. The host calls advance(nowMs) from
// its event loop; due tasks run inline on that thread. Each run reschedules
// after interval x priority multiplier (x3 while hidden for gated tasks),
// jittered by +/- jitterPct, never below 100ms.
class RefreshScheduler {
public:
  explicit RefreshScheduler(std::uint32_t seed = 0x5eedu);

  // Replaces a task with the same id. Throws std::invalid_argument on an
  // empty id. The first run is one (jittered) interval from nowMs.
  void registerTask(const SchedulerTask& task, std::int64_t nowMs);
  void unregisterTask(const std::string& id);
  bool hasTask(const std::string& id) const;

  void setVisible(bool visible) { visible_ = visible; }
  bool visible() const { return visible_; }

  void pause(const std::string& id);
  void resume(const std::string& id, std::int64_t nowMs);

  // Make a task due at nowMs (runs on the next advance()).
  void rearm(const std::string& id, std::int64_t nowMs);

  // Run every due task. Returns the number of task runs.
  int advance(std::int64_t nowMs);

  const SchedulerTaskStats* stats(const std::string& id) const;

  // Jittered delay in [base*(1-jitter), base*(1+jitter)], at least 100ms.
  std::int64_t withJitter(std::int64_t baseMs, double jitterPct);

private:
  struct Entry {
    SchedulerTask task;
    SchedulerTaskStats stats;
  };

  bool canRunNow(const Entry& e) const;
  std::int64_t computeDelay(const Entry& e);

  std::unordered_map<std::string, Entry> tasks_;
  bool visible_{true};
  std::mt19937 rng_;
};

} // namespace mtc
