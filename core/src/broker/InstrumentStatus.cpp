#include "mtc/broker/InstrumentStatus.hpp"

#include <rapidjson/document.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace mtc {

static std::string lower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static std::string upper(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  return s;
}

static std::string trim(const std::string& s) {
  std::size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  std::size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

// 1 / 0 / -1 for a bool-ish JSON value.
static int boolFrom(const rapidjson::Value& v) {
  if (v.IsBool()) return v.GetBool() ? 1 : 0;
  std::string s;
  if (v.IsString()) s = v.GetString();
  else if (v.IsNumber()) s = v.GetDouble() == 0.0 ? "0" : (v.GetDouble() == 1.0 ? "1" : "");
  s = lower(trim(s));
  if (s.empty()) return -1;
  for (const char* t : {"true", "1", "yes", "open", "trading", "active"}) {
    if (s == t) return 1;
  }
  for (const char* f : {"false", "0", "no", "closed", "halted", "inactive", "suspended"}) {
    if (s == f) return 0;
  }
  return -1;
}

static std::string labelFrom(const rapidjson::Value& obj) {
  for (const char* key : {"status", "state", "sessionStatus", "marketStatus"}) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) continue;
    std::string s = trim(it->value.GetString());
    if (!s.empty()) return upper(s);
  }
  return "";
}

int parseSessionOpen(const std::string& sessionStatusJson) {
  if (sessionStatusJson.empty()) return -1;
  rapidjson::Document doc;
  doc.Parse(sessionStatusJson.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return -1;

  for (const char* key : {"isOpen", "isTrading", "isMarketOpen", "open", "active"}) {
    auto it = doc.FindMember(key);
    if (it == doc.MemberEnd()) continue;
    int v = boolFrom(it->value);
    if (v >= 0) return v;
  }

  std::string label = labelFrom(doc);
  if (label.find("OPEN") != std::string::npos ||
      label.find("TRADING") != std::string::npos ||
      label.find("ACTIVE") != std::string::npos) return 1;
  if (label.find("CLOSED") != std::string::npos ||
      label.find("HALT") != std::string::npos ||
      label.find("SUSPEND") != std::string::npos) return 0;
  return -1;
}

std::string resolveSessionLabel(const std::string& sessionStatusJson) {
  if (sessionStatusJson.empty()) return "";
  rapidjson::Document doc;
  doc.Parse(sessionStatusJson.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return "";
  return labelFrom(doc);
}

std::string formatConstraintError(const std::string& message, const std::string& brokerLabel) {
  std::string raw = trim(message);
  if (raw.empty()) return "Constraints unavailable.";
  std::string broker = brokerLabel.empty() ? "broker" : brokerLabel;
  std::string l = lower(raw);
  if (l.find("accnum") != std::string::npos || l.find("accountid") != std::string::npos ||
      l.find("account id") != std::string::npos) {
    return "Select a " + broker + " account to load constraints.";
  }
  if (l.find("developer") != std::string::npos || l.find("api key") != std::string::npos) {
    return "Add a " + broker + " developer API key to load constraints.";
  }
  if (l.find("400") != std::string::npos || l.find("bad request") != std::string::npos) {
    return "Constraints unavailable for this symbol.";
  }
  return raw;
}

InstrumentStatus applyConstraintsResponse(const ConstraintsResponse& res,
                                          const std::string& brokerLabel,
                                          std::int64_t nowMs) {
  InstrumentStatus st;
  st.fetchedAtMs = nowMs;
  if (!res.ok) {
    st.error = formatConstraintError(res.error, brokerLabel);
    return st;
  }
  const auto& c = res.constraints;
  st.minStopDistance = c.minStopDistance > 0 ? c.minStopDistance : 0;
  st.priceStep = c.priceStep > 0 ? c.priceStep : 0;
  st.sessionOpen = c.sessionOpen >= 0 ? c.sessionOpen : parseSessionOpen(c.sessionStatusJson);
  st.sessionLabel = resolveSessionLabel(c.sessionStatusJson);
  return st;
}

} // namespace mtc
