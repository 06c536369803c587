#pragma once

#include "coloc/core/types/ChannelStack.hpp"
#include "coloc/core/types/ColocParams.hpp"
#include "coloc/core/util/ColocStatistics.hpp"
#include "coloc/core/util/JointHistogram.hpp"

namespace coloc {

// Everything derived from one slice of a channel pair
struct SliceOutput {
    SliceStatistics stats;
    JointHistogram histogram;
    ColorPlane quadrantPlot;        // empty unless params.renderQuadrantPlot
    ColorPlane intensityPlot;       // empty unless params.renderIntensityPlot
    IntensityPlane colocMask;       // always computed, 255 where colocalized
};

// One fused pass over the pixels accumulates the joint histogram, the
// classification and the Pearson sums; a second pass over the 256x256
// histogram renders the log-intensity plot.
// Throws DimensionMismatch if the planes differ in size.
SliceOutput processSlice(const IntensityPlane& plane1, const IntensityPlane& plane2,
                         const ChannelSpec& channel1, const ChannelSpec& channel2,
                         const ColocParams& params);

}  // namespace coloc
