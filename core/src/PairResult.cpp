#include "coloc/core/types/PairResult.hpp"

#include <utility>

namespace coloc {

ChannelStack PairResult::maskStack(const std::string& title) const
{
    // Shallow copies; mask planes are never written after the pass that produced them
    std::vector<IntensityPlane> masks(colocMasks.begin(), colocMasks.end());
    return ChannelStack(title, std::move(masks));
}

}  // namespace coloc
