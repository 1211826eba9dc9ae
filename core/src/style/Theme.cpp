#include "mtc/style/Theme.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace mtc {

static int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool parseHex(const std::string& s, Color& out) {
  std::string digits = s.substr(1);
  if (digits.size() == 3) {
    std::string expanded;
    for (char c : digits) {
      expanded.push_back(c);
      expanded.push_back(c);
    }
    digits = expanded;
  }
  if (digits.size() != 6 && digits.size() != 8) return false;
  float ch[4] = {0, 0, 0, 1};
  for (std::size_t i = 0; i < digits.size() / 2; i++) {
    int hi = hexDigit(digits[i * 2]);
    int lo = hexDigit(digits[i * 2 + 1]);
    if (hi < 0 || lo < 0) return false;
    ch[i] = static_cast<float>(hi * 16 + lo) / 255.0f;
  }
  out = {ch[0], ch[1], ch[2], ch[3]};
  return true;
}

static bool parseFunctional(const std::string& s, Color& out) {
  std::size_t open = s.find('(');
  std::size_t close = s.rfind(')');
  if (open == std::string::npos || close == std::string::npos || close <= open) return false;

  std::vector<float> parts;
  std::string inner = s.substr(open + 1, close - open - 1);
  std::size_t start = 0;
  while (start <= inner.size()) {
    std::size_t comma = inner.find(',', start);
    std::string tok = inner.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    char* end = nullptr;
    float v = std::strtof(tok.c_str(), &end);
    if (end == tok.c_str()) return false;
    parts.push_back(v);
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  if (parts.size() != 3 && parts.size() != 4) return false;
  out.r = parts[0] / 255.0f;
  out.g = parts[1] / 255.0f;
  out.b = parts[2] / 255.0f;
  out.a = parts.size() == 4 ? parts[3] : 1.0f;
  return true;
}

bool parseCssColor(const std::string& text, Color& out) {
  std::string s;
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) s.push_back(c);
  }
  if (s.empty()) return false;
  if (s[0] == '#') return parseHex(s, out);
  if (s.compare(0, 4, "rgba") == 0 || s.compare(0, 3, "rgb") == 0) {
    return parseFunctional(s, out);
  }
  return false;
}

Color cssColor(const char* text) {
  Color c{1, 1, 1, 1};
  if (!parseCssColor(text ? text : "", c)) {
    std::fprintf(stderr, "cssColor: unrecognized color '%s'\n", text ? text : "");
  }
  return c;
}

ChartTheme darkChartTheme() {
  ChartTheme t;
  t.name = "Dark";
  t.bg            = cssColor("#050505");
  t.panel         = cssColor("#0b0b0b");
  t.grid          = cssColor("rgba(255,255,255,0.05)");
  t.gridStrong    = cssColor("rgba(255,255,255,0.12)");
  t.text          = cssColor("#d1d5db");
  t.textDim       = cssColor("#6b7280");
  t.textError     = cssColor("#fca5a5");
  t.up            = cssColor("#22c55e");
  t.down          = cssColor("#f87171");
  t.wick          = cssColor("rgba(148,163,184,0.7)");
  t.smaFast       = cssColor("#38bdf8");
  t.smaSlow       = cssColor("#fbbf24");
  t.range         = cssColor("rgba(148,163,184,0.55)");
  t.last          = cssColor("#22d3ee");
  t.order         = cssColor("#f97316");
  t.position      = cssColor("#a3e635");
  t.constraint    = cssColor("#f472b6");
  t.setupEntry    = cssColor("#38bdf8");
  t.setupStop     = cssColor("#f97316");
  t.setupTp       = cssColor("#22c55e");
  t.tagBox        = cssColor("rgba(0,0,0,0.6)");
  t.quoteBand     = cssColor("rgba(34,211,238,0.08)");
  t.atrBand       = cssColor("rgba(34,211,238,0.08)");
  t.sessionClosed = cssColor("rgba(248,113,113,0.08)");
  t.sessionClosedText = cssColor("rgba(248,113,113,0.8)");
  return t;
}

} // namespace mtc
