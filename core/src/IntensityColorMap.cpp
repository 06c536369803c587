#include "coloc/core/util/IntensityColorMap.hpp"

#include <algorithm>
#include <cmath>

#include "coloc/core/types/ColocParams.hpp"

namespace coloc {

namespace {

constexpr double kLowBreak = 0.1;
constexpr double kHighBreak = 0.7;

uint8_t channel(double v)
{
    return static_cast<uint8_t>(std::clamp(static_cast<int>(v), 0, 255));
}

}  // namespace

RgbColor intensityColor(double ratio)
{
    if (std::isnan(ratio)) {
        return colors::Black;
    }
    ratio = std::clamp(ratio, 0.0, 1.0);

    if (ratio <= kLowBreak) {
        const double t = std::min(ratio / kLowBreak, 1.0);
        return {channel(188 * t), channel(110 * t), channel(209 * t)};
    }
    if (ratio <= kHighBreak) {
        const double t = std::min((ratio - kLowBreak) / (kHighBreak - kLowBreak), 1.0);
        return {channel(255 * t + 188 * (1 - t)), channel(174 * t + 110 * (1 - t)), channel(209 * (1 - t))};
    }
    const double t = std::min((ratio - kHighBreak) / (1.0 - kHighBreak), 1.0);
    return {255, channel(252 * t + 174 * (1 - t)), channel(246 * t)};
}

double logCountRatio(int32_t count, int32_t maxCount)
{
    if (count <= 0) {
        return 0.0;
    }
    if (maxCount <= 1) {
        return 1.0;
    }
    const double ratio = std::log(static_cast<double>(count) + 1.0) / std::log(static_cast<double>(maxCount));
    return std::clamp(ratio, 0.0, 1.0);
}

ColorPlane renderIntensityPlot(const JointHistogram& hist)
{
    ColorPlane plot(kIntensityLevels, kIntensityLevels);
    const int32_t maxCount = hist.maxCount();
    for (int z1 = 0; z1 < kIntensityLevels; z1++) {
        for (int z2 = 0; z2 < kIntensityLevels; z2++) {
            const RgbColor c = intensityColor(logCountRatio(hist.count(z1, z2), maxCount));
            plot(kMaxIntensity - z2, z1) = c.toBgr();
        }
    }
    return plot;
}

}  // namespace coloc
