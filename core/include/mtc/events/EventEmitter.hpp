#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace mtc {

using SubscriptionId = std::uint32_t;

// Observer registration for one typed event. Listeners run synchronously in
// subscription order. A listener may unsubscribe itself (or another) while an
// event is being delivered.
template <typename Event>
class EventEmitter {
public:
  using Listener = std::function<void(const Event&)>;

  SubscriptionId subscribe(Listener fn) {
    SubscriptionId id = nextId_++;
    listeners_.push_back({id, std::move(fn)});
    return id;
  }

  bool unsubscribe(SubscriptionId id) {
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
      if (it->id == id) {
        listeners_.erase(it);
        return true;
      }
    }
    return false;
  }

  void emit(const Event& event) const {
    // Copy so listeners can mutate the subscription list.
    std::vector<Slot> snapshot = listeners_;
    for (const auto& slot : snapshot) {
      if (slot.fn) slot.fn(event);
    }
  }

  std::size_t size() const { return listeners_.size(); }
  bool empty() const { return listeners_.empty(); }
  void clear() { listeners_.clear(); }

private:
  struct Slot {
    SubscriptionId id;
    Listener fn;
  };

  std::vector<Slot> listeners_;
  SubscriptionId nextId_{1};
};

} // namespace mtc
