#pragma once
#include <cstdint>

namespace mtc {

struct QuoteThrottleConfig {
  std::int64_t repeatWindowMs{1000};   // same price inside this window is dropped
  std::int64_t minIntervalMs{200};     // anything closer than this is dropped
};

struct AcceptedQuote {
  double price{0};
  std::int64_t ts{0};
};

// Decides which quotes reach the bar synthesizer. Remembers the last
// accepted quote so it can be re-applied after a history refresh.
class QuoteThrottle {
public:
  void setConfig(const QuoteThrottleConfig& cfg) { config_ = cfg; }
  const QuoteThrottleConfig& config() const { return config_; }

  // True if the quote was accepted (and is now the last one).
  bool accept(double price, std::int64_t ts);

  bool hasLast() const { return hasLast_; }
  const AcceptedQuote& last() const { return last_; }
  void reset() { hasLast_ = false; last_ = {}; }

private:
  QuoteThrottleConfig config_;
  AcceptedQuote last_;
  bool hasLast_{false};
};

} // namespace mtc
