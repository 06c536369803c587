#include "coloc/core/util/JointHistogram.hpp"

#include "coloc/core/types/ColocParams.hpp"
#include "coloc/core/types/Errors.hpp"

namespace coloc {

JointHistogram::JointHistogram()
    : counts_(kIntensityLevels, kIntensityLevels, int32_t(0))
{
}

int64_t JointHistogram::total() const
{
    int64_t sum = 0;
    for (int z1 = 0; z1 < kIntensityLevels; z1++) {
        const int32_t* row = counts_[z1];
        for (int z2 = 0; z2 < kIntensityLevels; z2++) {
            sum += row[z2];
        }
    }
    return sum;
}

cv::Mat_<float> JointHistogram::toRaster() const
{
    cv::Mat_<float> raster(kIntensityLevels, kIntensityLevels, 0.0f);
    for (int z1 = 0; z1 < kIntensityLevels; z1++) {
        for (int z2 = 0; z2 < kIntensityLevels; z2++) {
            raster(kMaxIntensity - z2, z1) = static_cast<float>(counts_(z1, z2));
        }
    }
    return raster;
}

JointHistogram buildJointHistogram(const IntensityPlane& plane1, const IntensityPlane& plane2)
{
    requireSameSize(plane1.size(), plane2.size(), "Channel planes");

    JointHistogram hist;
    for (int y = 0; y < plane1.rows; y++) {
        const uint8_t* row1 = plane1[y];
        const uint8_t* row2 = plane2[y];
        for (int x = 0; x < plane1.cols; x++) {
            hist.add(row1[x], row2[x]);
        }
    }
    return hist;
}

}  // namespace coloc
