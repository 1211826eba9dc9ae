#pragma once
#include <vector>

namespace mtc {

struct LabelPlacerConfig {
  double minSpacing{12};   // center-to-center, px
  double topInset{10};     // from plot.y
  double bottomInset{6};   // from plot.y + plot.h
};

// Vertical placement for right-hand level tags. Each desired center is
// clamped into [top, bottom]; tags are then stacked at least minSpacing
// apart, pushing down first and shifting the column back up when the last
// one would pass the bottom bound.
//
// Returns one center per input, in input order. When the column does not
// fit at all the top bound wins and the spacing is kept.
std::vector<double> placeLabels(const std::vector<double>& desiredY,
                                double top, double bottom,
                                double minSpacing);

// Same, using the plot rectangle's vertical extent and the insets.
std::vector<double> placeLevelTags(const std::vector<double>& desiredY,
                                   double plotY, double plotH,
                                   const LabelPlacerConfig& cfg = LabelPlacerConfig{});

} // namespace mtc
