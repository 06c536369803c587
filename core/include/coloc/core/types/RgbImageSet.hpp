#pragma once

#include <optional>

#include "coloc/core/types/ChannelStack.hpp"

namespace coloc {

// Channels of one image (or of separately loaded channel images); any may be absent
struct RgbImageSet {
    std::optional<ChannelStack> red;
    std::optional<ChannelStack> green;
    std::optional<ChannelStack> blue;
};

}  // namespace coloc
