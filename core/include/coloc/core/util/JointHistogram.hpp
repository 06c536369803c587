#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

#include "coloc/core/types/ChannelStack.hpp"

namespace coloc {

// 256x256 co-occurrence counts of two channels' intensities for one slice.
// Row index is the channel-1 intensity, column index the channel-2 intensity.
class JointHistogram
{
public:
    JointHistogram();

    void add(uint8_t z1, uint8_t z2)
    {
        int32_t& c = counts_(z1, z2);
        ++c;
        if (c > maxCount_) {
            maxCount_ = c;
        }
    }

    [[nodiscard]] int32_t count(int z1, int z2) const { return counts_(z1, z2); }
    [[nodiscard]] int32_t maxCount() const { return maxCount_; }
    [[nodiscard]] const cv::Mat_<int32_t>& counts() const { return counts_; }

    // Sum over all cells, equal to the number of pixels accumulated
    [[nodiscard]] int64_t total() const;

    // Raster view for display: column z1, row 255 - z2 (intensity axis 2 points up)
    [[nodiscard]] cv::Mat_<float> toRaster() const;

private:
    cv::Mat_<int32_t> counts_;
    int32_t maxCount_{0};
};

// Accumulates the joint histogram of two planes.
// Throws DimensionMismatch before reading any pixel if the planes differ in size.
JointHistogram buildJointHistogram(const IntensityPlane& plane1, const IntensityPlane& plane2);

}  // namespace coloc
