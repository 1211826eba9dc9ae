#include "mtc/data/Symbols.hpp"

#include <cctype>

namespace mtc {

std::string normalizeSymbolKey(const std::string& value) {
  std::string raw;
  raw.reserve(value.size());
  for (char ch : value) raw.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));

  std::size_t colon = raw.rfind(':');
  if (colon != std::string::npos) raw = raw.substr(colon + 1);

  std::string out;
  out.reserve(raw.size());
  for (char ch : raw) {
    if (std::isspace(static_cast<unsigned char>(ch))) continue;
    out.push_back(ch);
  }

  std::size_t dot = out.find('.');
  if (dot != std::string::npos && dot > 0) out.resize(dot);
  return out;
}

std::string normalizeSymbolLoose(const std::string& value) {
  std::string base = normalizeSymbolKey(value);
  std::string out;
  out.reserve(base.size());
  for (char ch : base) {
    if (std::isalnum(static_cast<unsigned char>(ch))) out.push_back(ch);
  }
  return out;
}

} // namespace mtc
