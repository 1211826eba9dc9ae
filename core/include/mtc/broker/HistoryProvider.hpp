#pragma once
#include "mtc/history/Coverage.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace mtc {

struct HistoryRequest {
  std::string symbol;
  std::string resolution;
  std::int64_t fromMs{0};
  std::int64_t toMs{0};
  std::int64_t maxAgeMs{0};   // 0 = bypass any cache
};

struct HistoryResponse {
  bool ok{false};
  std::string barsJson;       // raw bar records, JSON array
  std::int64_t fetchedAtMs{0};
  std::string source;
  std::string error;
  Coverage coverage;
  bool hasCoverage{false};
};

using HistoryCallback = std::function<void(const HistoryResponse&)>;

// Broker history collaborator. The callback may run synchronously or later,
// but always on the engine's thread.
class HistoryProvider {
public:
  virtual ~HistoryProvider() = default;
  virtual void getHistorySeries(const HistoryRequest& request, HistoryCallback done) = 0;
};

} // namespace mtc
