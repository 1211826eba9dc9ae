#pragma once
#include <string>

namespace mtc {

struct Color {
  float r{0}, g{0}, b{0}, a{1};
};

inline Color withAlpha(Color c, float a) {
  c.a = a;
  return c;
}

// "#rgb", "#rrggbb" or "rgba(r,g,b,a)" / "rgb(r,g,b)". Returns false on
// anything else (out unchanged).
bool parseCssColor(const std::string& text, Color& out);

// Parse or fall back to opaque white.
Color cssColor(const char* text);

struct ChartTheme {
  std::string name;

  Color bg;
  Color panel;
  Color grid;
  Color gridStrong;
  Color text;
  Color textDim;
  Color textError;
  Color up;
  Color down;
  Color wick;
  Color smaFast;
  Color smaSlow;
  Color range;
  Color last;
  Color order;
  Color position;
  Color constraint;
  Color setupEntry;
  Color setupStop;
  Color setupTp;
  Color tagBox;           // backing box behind level tags
  Color quoteBand;        // bid/ask band
  Color atrBand;
  Color sessionClosed;
  Color sessionClosedText;
};

ChartTheme darkChartTheme();

} // namespace mtc
