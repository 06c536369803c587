#include "coloc/core/types/ChannelStack.hpp"

#include <stdexcept>
#include <utility>

#include "coloc/core/types/Errors.hpp"

namespace coloc {

ChannelStack::ChannelStack(std::string title, std::vector<IntensityPlane> slices,
                           std::filesystem::path sourcePath)
    : title_(std::move(title)), sourcePath_(std::move(sourcePath)), slices_(std::move(slices))
{
    if (slices_.empty()) {
        return;
    }

    size_ = slices_.front().size();
    for (size_t i = 0; i < slices_.size(); i++) {
        if (slices_[i].empty()) {
            throw std::invalid_argument(title_ + ": slice " + std::to_string(i + 1) + " is empty");
        }
        requireSameSize(size_, slices_[i].size(),
                        title_ + ": slice 1 and slice " + std::to_string(i + 1));
    }
}

}  // namespace coloc
