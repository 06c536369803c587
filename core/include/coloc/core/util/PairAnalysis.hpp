#pragma once

#include <string>

#include "coloc/core/types/ChannelStack.hpp"
#include "coloc/core/types/ColocParams.hpp"
#include "coloc/core/types/PairResult.hpp"

namespace coloc {

// Label of the pseudo-channel built from a pair's colocalization masks
inline const std::string kRedGreenMaskLabel = "Red+Green_colocalized";
inline const std::string kRedGreenMaskTitle = "Colocalized_Red_and_Green_channels";

/**
 * Colocalizes two stacks slice by slice.
 *
 * Uses min(stack1.numSlices(), stack2.numSlices()) slices. Slices are
 * processed in parallel when OpenMP is available; results are stored by
 * slice index so the output order never depends on completion order.
 *
 * @throws DimensionMismatch if the stacks' planes differ in size
 */
PairResult colocalizePair(const ChannelStack& stack1, const ChannelStack& stack2,
                          const ChannelSpec& channel1, const ChannelSpec& channel2,
                          const ColocParams& params);

/**
 * Three-channel chain: colocalizes @p stack against the colocalization
 * masks of @p source, using params.maskThreshold for the mask side.
 * Quadrant and intensity plots are never rendered for a mask pass.
 *
 * @throws DimensionMismatch if @p stack and the masks differ in size
 */
PairResult colocalizeWithMask(const ChannelStack& stack, const ChannelSpec& channel,
                              const PairResult& source, const ColocParams& params,
                              const std::string& maskTitle = kRedGreenMaskTitle,
                              const std::string& maskLabel = kRedGreenMaskLabel,
                              const RgbColor& maskColor = colors::Orange);

}  // namespace coloc
