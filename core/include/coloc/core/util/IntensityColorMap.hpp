#pragma once

#include <cstdint>

#include "coloc/core/types/ChannelStack.hpp"
#include "coloc/core/types/Color.hpp"
#include "coloc/core/util/JointHistogram.hpp"

namespace coloc {

// False-colour ramp for a normalized log count ratio in [0, 1]:
//   [0, 0.1]    black -> (188,110,209)
//   (0.1, 0.7]  (188,110,209) -> (255,174,0)
//   (0.7, 1]    (255,174,0) -> (255,252,246)
// Ratios outside [0, 1] are clamped, NaN maps to black.
RgbColor intensityColor(double ratio);

// log(count + 1) / log(maxCount), clamped to [0, 1].
// For maxCount <= 1 the ratio is 1 for occupied cells and 0 otherwise.
double logCountRatio(int32_t count, int32_t maxCount);

// Log-intensity plot of a finished histogram, same raster layout as the
// quadrant plot (column z1, row 255 - z2), without threshold lines.
ColorPlane renderIntensityPlot(const JointHistogram& hist);

}  // namespace coloc
