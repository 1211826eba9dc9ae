#pragma once
#include "mtc/broker/ConstraintsProvider.hpp"

#include <cstdint>
#include <string>

namespace mtc {

// What the chart knows about the instrument's trading constraints.
struct InstrumentStatus {
  bool loading{false};
  double minStopDistance{0};
  double priceStep{0};
  int sessionOpen{-1};          // 1 open, 0 closed, -1 unknown
  std::string sessionLabel;     // "OPEN", "CLOSED", ...
  std::string error;
  std::int64_t fetchedAtMs{0};
};

// Interpret a broker sessionStatus object (JSON text).
// Returns 1 open, 0 closed, -1 unknown.
int parseSessionOpen(const std::string& sessionStatusJson);

// Upper-cased status/state/sessionStatus/marketStatus, empty if absent.
std::string resolveSessionLabel(const std::string& sessionStatusJson);

// Turn a raw constraint-fetch error into a hint for the user.
std::string formatConstraintError(const std::string& message, const std::string& brokerLabel);

// Fold a provider response into an InstrumentStatus.
InstrumentStatus applyConstraintsResponse(const ConstraintsResponse& res,
                                          const std::string& brokerLabel,
                                          std::int64_t nowMs);

} // namespace mtc
