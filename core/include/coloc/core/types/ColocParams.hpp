#pragma once

#include <string>

#include "coloc/core/types/Color.hpp"

namespace coloc {

// Highest 8-bit intensity; a threshold of kMaxIntensity + 1 classifies nothing as above threshold
inline constexpr int kMaxIntensity = 255;
inline constexpr int kIntensityLevels = 256;

// Threshold applied to binary colocalization masks (0 or 255) in chained passes
inline constexpr int kDefaultMaskThreshold = 100;

// One side of a channel pair
struct ChannelSpec {
    std::string label;                  // e.g. "Red", "Red+Green_colocalized"
    int threshold = 75;                 // noise threshold, 0..256
    RgbColor color = colors::White;     // quadrant colour for "this channel only"
};

// Analysis settings. Passed by value into every analysis call, never shared mutable state.
struct ColocParams {
    // Per-channel noise thresholds for the RGB workflow
    int redThreshold = 75;
    int greenThreshold = 75;
    int blueThreshold = 75;

    // Threshold of the mask pseudo-channel in the three-channel chain
    int maskThreshold = kDefaultMaskThreshold;

    // Drop below-both pixels from the Pearson sums and pixel count
    bool excludeBelowThresholdFromPearson = false;

    // Derived planes to keep in the PairResult; the mask is always computed
    bool renderQuadrantPlot = false;
    bool renderIntensityPlot = false;
    bool renderColocMask = false;

    // Merge pairs of one image set left-to-right per slice instead of stacking rows
    bool channelsInOneRow = true;

    [[nodiscard]] ChannelSpec red() const { return {"Red", redThreshold, colors::Red}; }
    [[nodiscard]] ChannelSpec green() const { return {"Green", greenThreshold, colors::Green}; }
    [[nodiscard]] ChannelSpec blue() const { return {"Blue", blueThreshold, colors::Blue}; }
};

}  // namespace coloc
