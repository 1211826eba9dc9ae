#include "mtc/render/LabelPlacer.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>

namespace mtc {

std::vector<double> placeLabels(const std::vector<double>& desiredY,
                                double top, double bottom,
                                double minSpacing) {
  std::size_t n = desiredY.size();
  std::vector<double> out(n, top);
  if (n == 0) return out;
  if (bottom < top) bottom = top;

  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return desiredY[a] < desiredY[b];
  });

  std::vector<double> ys(n);
  for (std::size_t k = 0; k < n; k++) {
    double y = std::max(top, std::min(bottom, desiredY[order[k]]));
    if (k > 0) y = std::max(y, ys[k - 1] + minSpacing);
    ys[k] = y;
  }

  // Pushed past the bottom: pull the tail back up, keeping the spacing.
  if (ys[n - 1] > bottom) {
    ys[n - 1] = bottom;
    for (std::size_t k = n - 1; k-- > 0; ) {
      ys[k] = std::min(ys[k], ys[k + 1] - minSpacing);
    }
  }

  // Too many tags for the column: restack from the top.
  if (ys[0] < top) {
    ys[0] = top;
    for (std::size_t k = 1; k < n; k++) {
      ys[k] = std::max(ys[k], ys[k - 1] + minSpacing);
    }
  }

  for (std::size_t k = 0; k < n; k++) out[order[k]] = ys[k];
  return out;
}

std::vector<double> placeLevelTags(const std::vector<double>& desiredY,
                                   double plotY, double plotH,
                                   const LabelPlacerConfig& cfg) {
  return placeLabels(desiredY, plotY + cfg.topInset, plotY + plotH - cfg.bottomInset,
                     cfg.minSpacing);
}

} // namespace mtc
