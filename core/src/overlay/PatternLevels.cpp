#include "mtc/overlay/PatternLevels.hpp"

#include <cctype>
#include <cmath>

namespace mtc {

static std::string trimmed(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
  return s.substr(b, e - b);
}

static std::string lowered(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static bool contains(const std::string& hay, const char* needle) {
  return hay.find(needle) != std::string::npos;
}

std::string formatPatternLabel(const std::string& type) {
  std::string raw = trimmed(type);
  if (raw.empty()) return "Pattern";
  std::string out;
  out.reserve(raw.size());
  bool wordStart = true;
  for (char ch : raw) {
    char c = ch == '_' ? ' ' : static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    bool alnum = std::isalnum(static_cast<unsigned char>(c)) != 0;
    if (alnum && wordStart) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    wordStart = !alnum;
    out.push_back(c);
  }
  return out;
}

Color resolvePatternColor(const std::string& type, const ChartTheme& theme) {
  std::string key = lowered(type);
  if (contains(key, "bear") || contains(key, "resistance") || contains(key, "swing_high")) return theme.down;
  if (contains(key, "bull") || contains(key, "support") || contains(key, "swing_low")) return theme.up;
  return theme.range;
}

LevelList buildPatternLevels(const PatternEvent& event, const ChartTheme& theme) {
  LevelList levels;
  std::string type = trimmed(event.type);
  if (type.empty()) return levels;

  Color color = resolvePatternColor(type, theme);
  auto push = [&](const char* key, const std::string& label, LevelStyle style) {
    auto it = event.payload.find(key);
    if (it == event.payload.end() || !std::isfinite(it->second)) return;
    OverlayLevel lv;
    lv.kind = LevelKind::Pattern;
    lv.price = it->second;
    lv.label = label;
    lv.color = color;
    lv.style = style;
    lv.priority = 4;
    levels.push_back(lv);
  };

  const LevelStyle solid = LevelStyle::Solid;
  const LevelStyle dashed = LevelStyle::Dashed;

  if (type == "swing_high") {
    push("price", "Swing High", dashed);
  } else if (type == "swing_low") {
    push("price", "Swing Low", dashed);
  } else if (type == "structure_break_bull" || type == "structure_break_bear") {
    push("level", "Structure Break", solid);
  } else if (type == "range_breakout_bull") {
    push("high", "Range Break", solid);
    push("low", "Range Low", dashed);
  } else if (type == "range_breakout_bear") {
    push("low", "Range Break", solid);
    push("high", "Range High", dashed);
  } else if (type == "support_hold") {
    push("level", "Support", dashed);
  } else if (type == "resistance_hold") {
    push("level", "Resistance", dashed);
  } else if (type == "fvg_bull" || type == "fvg_bear") {
    push("gapHigh", "FVG High", dashed);
    push("gapLow", "FVG Low", dashed);
  } else if (type == "trend_pullback_bull" || type == "trend_pullback_bear") {
    push("emaFast", "Pullback EMA", dashed);
  } else {
    std::string label = formatPatternLabel(type);
    push("level", label, dashed);
    push("price", label, dashed);
  }
  return levels;
}

} // namespace mtc
