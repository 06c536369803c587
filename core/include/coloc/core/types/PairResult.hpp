#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "coloc/core/types/ChannelStack.hpp"
#include "coloc/core/types/ColocParams.hpp"
#include "coloc/core/util/ColocStatistics.hpp"
#include "coloc/core/util/JointHistogram.hpp"

namespace coloc {

// All slices of one channel-pair comparison. Returned by value, the
// engine keeps no reference to it.
struct PairResult {
    std::string image1Title;
    std::string image2Title;
    std::filesystem::path image1Path;
    std::filesystem::path image2Path;

    ChannelSpec channel1;
    ChannelSpec channel2;

    cv::Size planeSize{0, 0};

    // One entry per slice, in slice order
    std::vector<SliceStatistics> slices;
    std::vector<JointHistogram> histograms;
    std::vector<ColorPlane> quadrantPlots;      // empty planes if not rendered
    std::vector<ColorPlane> intensityPlots;     // empty planes if not rendered
    std::vector<IntensityPlane> colocMasks;

    [[nodiscard]] int numSlices() const { return static_cast<int>(slices.size()); }

    // "<image1> vs <image2>"
    [[nodiscard]] std::string imagesLabel() const { return image1Title + " vs " + image2Title; }
    // "<ch1> vs <ch2>"
    [[nodiscard]] std::string channelsLabel() const { return channel1.label + " vs " + channel2.label; }

    // Colocalization masks as a pseudo-channel for a chained pass
    [[nodiscard]] ChannelStack maskStack(const std::string& title) const;
};

}  // namespace coloc
