#pragma once
#include "mtc/broker/HistoryProvider.hpp"
#include "mtc/frames/FrameManager.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mtc {

// Requests history for every active frame and writes the results into the
// frame manager. Each cycle carries a token; responses tagged with a
// superseded token are discarded.
class HistoryFetcher {
public:
  using CompletionHook = std::function<void(std::uint64_t token)>;

  explicit HistoryFetcher(FrameManager& frames);

  void setProvider(HistoryProvider* provider) { provider_ = provider; }
  void setConnected(bool connected) { connected_ = connected; }
  bool connected() const { return connected_; }
  void setBrokerLabel(const std::string& label) { brokerLabel_ = label; }
  const std::string& brokerLabel() const { return brokerLabel_; }

  // Called once when every frame of a still-current cycle has answered.
  void setCompletionHook(CompletionHook hook) { onComplete_ = std::move(hook); }

  // Start a cycle for all active frames. A non-forced refresh is ignored
  // while another cycle is in flight. Returns the cycle token, or 0 when no
  // cycle was started (ignored, empty symbol, or failed precondition).
  std::uint64_t refresh(const std::string& symbol, bool force, std::int64_t nowMs);

  // Supersede any in-flight cycle without starting a new one.
  void invalidate();

  std::uint64_t currentToken() const { return token_; }
  bool inFlight() const { return pending_ > 0; }
  std::uint32_t staleDiscarded() const { return staleDiscarded_; }

private:
  void failAll(const std::string& error);
  void apply(std::uint64_t token, const std::string& frameId,
             std::int64_t nowMs, const HistoryResponse& res);
  void settle(std::uint64_t token);

  FrameManager& frames_;
  HistoryProvider* provider_{nullptr};
  bool connected_{true};
  std::string brokerLabel_{"broker"};
  CompletionHook onComplete_;

  std::uint64_t token_{0};
  int pending_{0};
  std::uint32_t staleDiscarded_{0};

  // Outstanding callbacks hold a weak reference so a late answer after
  // destruction is dropped.
  std::shared_ptr<HistoryFetcher*> self_;
};

} // namespace mtc
