#pragma once

#include <array>
#include <cstdint>

#include "coloc/core/types/ChannelStack.hpp"
#include "coloc/core/types/ColocParams.hpp"
#include "coloc/core/types/RgbImageSet.hpp"

namespace coloc {

using IntensityHistogram = std::array<int64_t, 256>;

IntensityHistogram intensityHistogram(const IntensityPlane& plane);

// Iterative intermeans (IsoData) threshold. Bins 0 and 255 are ignored;
// returns 128 if fewer than two distinct occupied bins remain.
int autoThreshold(const IntensityHistogram& histogram);

int autoThreshold(const IntensityPlane& plane);

// Threshold of the middle slice (default 75 for an empty stack)
int autoThreshold(const ChannelStack& stack);

// Replaces the threshold of every channel present in @p set by its auto threshold
ColocParams withAutoThresholds(ColocParams params, const RgbImageSet& set);

}  // namespace coloc
