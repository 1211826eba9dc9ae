#pragma once
#include <string>

namespace mtc {

// "oanda:eur_usd.pro " -> "EUR_USD"
std::string normalizeSymbolKey(const std::string& value);

// normalizeSymbolKey with non-alphanumerics removed: "EUR/USD" -> "EURUSD".
// Feed filtering compares these.
std::string normalizeSymbolLoose(const std::string& value);

} // namespace mtc
