#pragma once
#include "mtc/overlay/Feeds.hpp"
#include "mtc/overlay/OverlayLevel.hpp"
#include "mtc/style/Theme.hpp"

#include <string>

namespace mtc {

// "range_breakout_bull" -> "Range Breakout Bull"; "" -> "Pattern".
std::string formatPatternLabel(const std::string& type);

// Bearish/resistance types use the down color, bullish/support the up
// color, anything else the range color.
Color resolvePatternColor(const std::string& type, const ChartTheme& theme);

// Levels for one detected pattern (priority 4, kind Pattern). Payload keys
// that are missing produce no level.
LevelList buildPatternLevels(const PatternEvent& event, const ChartTheme& theme);

} // namespace mtc
