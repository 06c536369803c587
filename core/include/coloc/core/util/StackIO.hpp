#pragma once

#include <filesystem>
#include <vector>

#include <opencv2/core.hpp>

#include "coloc/core/types/ChannelStack.hpp"
#include "coloc/core/types/RgbImageSet.hpp"

namespace coloc {

enum class ChannelSelect { Red = 0, Green = 1, Blue = 2 };

// Converts one plane to 8 bits. 8-bit input is copied; wider single-channel
// input is scaled from its min..max range to 0..255; colour input picks
// @p channel (BGR layout as read by OpenCV). Two-channel (gray + alpha)
// input uses its first channel whatever @p channel is.
IntensityPlane toIntensityPlane(const cv::Mat& image, ChannelSelect channel);

/**
 * Reads every page of an image file (multi-page TIFF or a single image).
 * Colour pages yield the selected channel, grayscale pages are used as is.
 * The stack title is the file name.
 *
 * @throws std::runtime_error if the file cannot be read
 */
ChannelStack loadChannelStack(const std::filesystem::path& path, ChannelSelect channel);

// Splits a colour image (or stack) into its three channels, all titled
// with the file name. Throws std::runtime_error for non-colour input.
RgbImageSet loadRgbStack(const std::filesystem::path& path);

// Writes planes as one multi-page file; empty planes are skipped.
// Throws std::runtime_error if nothing could be written.
void writePlaneStack(const std::filesystem::path& path, const std::vector<cv::Mat>& planes);

}  // namespace coloc
