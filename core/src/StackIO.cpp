#include "coloc/core/util/StackIO.hpp"

#include <stdexcept>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "coloc/core/util/Logging.hpp"

namespace fs = std::filesystem;

namespace coloc {

namespace {

IntensityPlane toGray8(const cv::Mat& gray)
{
    if (gray.depth() == CV_8U) {
        return IntensityPlane(gray.clone());
    }
    cv::Mat scaled;
    cv::normalize(gray, scaled, 0, 255, cv::NORM_MINMAX, CV_8U);
    return IntensityPlane(scaled);
}

std::vector<cv::Mat> readPages(const fs::path& path)
{
    std::vector<cv::Mat> pages;
    if (!cv::imreadmulti(path.string(), pages, cv::IMREAD_UNCHANGED) || pages.empty()) {
        cv::Mat single = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
        if (single.empty()) {
            throw std::runtime_error("Could not read image: " + path.string());
        }
        pages.clear();
        pages.push_back(single);
    }
    return pages;
}

}  // namespace

IntensityPlane toIntensityPlane(const cv::Mat& image, ChannelSelect channel)
{
    if (image.channels() == 1) {
        return toGray8(image);
    }

    std::vector<cv::Mat> planes;
    cv::split(image, planes);
    if (planes.size() < 3) {
        // gray + alpha: the intensity is the first plane
        return toGray8(planes.front());
    }

    // OpenCV colour order is B, G, R (, A)
    const int index = 2 - static_cast<int>(channel);
    return toGray8(planes[static_cast<size_t>(index)]);
}

ChannelStack loadChannelStack(const fs::path& path, ChannelSelect channel)
{
    std::vector<IntensityPlane> slices;
    for (const auto& page : readPages(path)) {
        slices.push_back(toIntensityPlane(page, channel));
    }
    Logger()->info("Loaded {} ({} slices)", path.string(), slices.size());
    return ChannelStack(path.filename().string(), std::move(slices), path);
}

RgbImageSet loadRgbStack(const fs::path& path)
{
    const auto pages = readPages(path);

    std::vector<IntensityPlane> red, green, blue;
    for (const auto& page : pages) {
        if (page.channels() < 3) {
            throw std::runtime_error("Not a 3-channel colour image: " + path.string());
        }
        red.push_back(toIntensityPlane(page, ChannelSelect::Red));
        green.push_back(toIntensityPlane(page, ChannelSelect::Green));
        blue.push_back(toIntensityPlane(page, ChannelSelect::Blue));
    }

    const std::string title = path.filename().string();
    Logger()->info("Loaded RGB {} ({} slices)", path.string(), pages.size());

    RgbImageSet set;
    set.red = ChannelStack(title, std::move(red), path);
    set.green = ChannelStack(title, std::move(green), path);
    set.blue = ChannelStack(title, std::move(blue), path);
    return set;
}

void writePlaneStack(const fs::path& path, const std::vector<cv::Mat>& planes)
{
    std::vector<cv::Mat> pages;
    for (const auto& p : planes) {
        if (!p.empty()) {
            pages.push_back(p);
        }
    }
    if (pages.empty()) {
        throw std::runtime_error("No planes to write for " + path.string());
    }

    bool ok = pages.size() == 1 ? cv::imwrite(path.string(), pages.front())
                                : cv::imwritemulti(path.string(), pages);
    if (!ok) {
        throw std::runtime_error("Failed to write image stack: " + path.string());
    }
    Logger()->info("Wrote {} ({} slices)", path.string(), pages.size());
}

}  // namespace coloc
