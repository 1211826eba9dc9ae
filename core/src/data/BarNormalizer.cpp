#include "mtc/data/BarNormalizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <string>

namespace mtc {

static bool toNumber(const rapidjson::Value& v, double& out) {
  if (v.IsNumber()) {
    out = v.GetDouble();
    return std::isfinite(out);
  }
  if (v.IsString()) {
    std::string s;
    const char* p = v.GetString();
    for (; *p; p++) {
      if (*p != ',') s.push_back(*p);
    }
    std::size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return false;
    const char* begin = s.c_str() + b;
    char* end = nullptr;
    double d = std::strtod(begin, &end);
    if (end == begin) return false;
    while (*end == ' ' || *end == '\t' || *end == '\r' || *end == '\n') end++;
    if (*end != '\0' || !std::isfinite(d)) return false;
    out = d;
    return true;
  }
  return false;
}

// First key (in order) that resolves to a finite number.
static bool pick(const rapidjson::Value& rec, std::initializer_list<const char*> keys,
                 double& out) {
  for (const char* k : keys) {
    auto it = rec.FindMember(k);
    if (it == rec.MemberEnd()) continue;
    if (toNumber(it->value, out)) return true;
  }
  return false;
}

bool normalizeBar(const rapidjson::Value& record, Candle& out) {
  if (!record.IsObject()) return false;

  double rawT = 0;
  if (!pick(record, {"t", "time", "timestamp"}, rawT)) return false;
  double ms = rawT > 1e11 ? rawT : rawT * 1000.0;
  if (!std::isfinite(ms) || ms <= 0) return false;

  double o = 0, h = 0, l = 0, c = 0;
  bool hasO = pick(record, {"o", "open", "c", "close"}, o);
  bool hasC = pick(record, {"c", "close", "o", "open"}, c);
  if (!hasO || !hasC) return false;

  bool hasH = pick(record, {"h", "high"}, h);
  bool hasL = pick(record, {"l", "low"}, l);
  if (!hasH) h = hasL ? std::max(o, l) : o;
  if (!hasL) l = std::min(o, h);

  out.t = static_cast<std::int64_t>(std::llround(ms));
  out.o = o;
  out.h = h;
  out.l = l;
  out.c = c;
  double v = 0;
  out.hasVolume = pick(record, {"v", "volume"}, v);
  out.v = out.hasVolume ? v : 0.0;
  return true;
}

NormalizeResult normalizeBars(const rapidjson::Value& records) {
  NormalizeResult result;
  if (!records.IsArray()) return result;

  result.bars.reserve(records.Size());
  for (const auto& rec : records.GetArray()) {
    Candle c;
    if (normalizeBar(rec, c)) {
      result.bars.push_back(c);
    } else {
      result.dropped++;
    }
  }

  std::stable_sort(result.bars.begin(), result.bars.end(),
                   [](const Candle& a, const Candle& b) { return a.t < b.t; });

  // Strictly increasing t: keep the last record of each timestamp.
  CandleSeries unique;
  unique.reserve(result.bars.size());
  for (const auto& c : result.bars) {
    if (!unique.empty() && unique.back().t == c.t) {
      unique.back() = c;
    } else {
      unique.push_back(c);
    }
  }
  result.bars.swap(unique);
  return result;
}

bool normalizeBarsJson(const std::string& json, NormalizeResult& out) {
  out = NormalizeResult{};
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) return false;

  if (doc.IsArray()) {
    out = normalizeBars(doc);
    return true;
  }
  if (doc.IsObject()) {
    auto it = doc.FindMember("bars");
    if (it != doc.MemberEnd() && it->value.IsArray()) {
      out = normalizeBars(it->value);
      return true;
    }
  }
  return false;
}

} // namespace mtc
