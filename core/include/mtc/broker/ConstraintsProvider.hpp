#pragma once
#include <functional>
#include <string>

namespace mtc {

struct InstrumentConstraints {
  double minStopDistance{0};
  double priceStep{0};
  int sessionOpen{-1};            // explicit flag: 1 open, 0 closed, -1 not given
  std::string sessionStatusJson;  // raw sessionStatus object
};

struct ConstraintsResponse {
  bool ok{false};
  InstrumentConstraints constraints;
  std::string error;
};

using ConstraintsCallback = std::function<void(const ConstraintsResponse&)>;

class ConstraintsProvider {
public:
  virtual ~ConstraintsProvider() = default;
  virtual void getInstrumentConstraints(const std::string& symbol, ConstraintsCallback done) = 0;
};

} // namespace mtc
