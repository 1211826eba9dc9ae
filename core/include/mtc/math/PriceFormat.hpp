#pragma once
#include <string>

namespace mtc {

// 2 decimals for |x| >= 1000, 4 for |x| >= 1, 6 below; trailing zeros stripped.
std::string formatPrice(double value);

// Fixed decimals without stripping ("0.85", "52.3").
std::string formatFixed(double value, int decimals);

} // namespace mtc
