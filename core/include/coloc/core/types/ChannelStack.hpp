#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace coloc {

// One 8-bit intensity plane (values 0-255)
using IntensityPlane = cv::Mat_<uint8_t>;

// Colour visualization buffer, BGR order
using ColorPlane = cv::Mat_<cv::Vec3b>;

// Ordered slices of one channel. All slices share width and height.
class ChannelStack
{
public:
    ChannelStack() = default;

    // Throws DimensionMismatch if the slices are not all the same size
    // and std::invalid_argument if a slice is empty.
    ChannelStack(std::string title, std::vector<IntensityPlane> slices,
                 std::filesystem::path sourcePath = {});

    [[nodiscard]] const std::string& title() const { return title_; }
    [[nodiscard]] const std::filesystem::path& sourcePath() const { return sourcePath_; }

    [[nodiscard]] int numSlices() const { return static_cast<int>(slices_.size()); }
    [[nodiscard]] bool empty() const { return slices_.empty(); }
    [[nodiscard]] cv::Size size() const { return size_; }

    [[nodiscard]] const IntensityPlane& slice(int index) const { return slices_.at(index); }

private:
    std::string title_;
    std::filesystem::path sourcePath_;
    std::vector<IntensityPlane> slices_;
    cv::Size size_{0, 0};
};

}  // namespace coloc
