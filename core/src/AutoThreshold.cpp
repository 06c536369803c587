#include "coloc/core/util/AutoThreshold.hpp"

#include <cmath>

#include "coloc/core/util/Logging.hpp"

namespace coloc {

namespace {

constexpr int kEmptyStackThreshold = 75;

}  // namespace

IntensityHistogram intensityHistogram(const IntensityPlane& plane)
{
    IntensityHistogram hist{};
    for (int y = 0; y < plane.rows; y++) {
        const uint8_t* row = plane[y];
        for (int x = 0; x < plane.cols; x++) {
            ++hist[row[x]];
        }
    }
    return hist;
}

int autoThreshold(const IntensityHistogram& histogram)
{
    IntensityHistogram h = histogram;
    // Saturated and zero pixels would dominate the means
    h[0] = 0;
    h[kMaxIntensity] = 0;

    int min = 0;
    while (h[min] == 0 && min < kMaxIntensity) {
        min++;
    }
    int max = kMaxIntensity;
    while (h[max] == 0 && max > 0) {
        max--;
    }
    if (min >= max) {
        return kIntensityLevels / 2;
    }

    int moving = min;
    double result = 0.0;
    do {
        double sum1 = 0.0, sum2 = 0.0, sum3 = 0.0, sum4 = 0.0;
        for (int i = min; i <= moving; i++) {
            sum1 += double(i) * h[i];
            sum2 += double(h[i]);
        }
        for (int i = moving + 1; i <= max; i++) {
            sum3 += double(i) * h[i];
            sum4 += double(h[i]);
        }
        result = (sum1 / sum2 + sum3 / sum4) / 2.0;
        moving++;
    } while ((moving + 1) <= result && moving < max - 1);

    return static_cast<int>(std::lround(result));
}

int autoThreshold(const IntensityPlane& plane)
{
    return autoThreshold(intensityHistogram(plane));
}

int autoThreshold(const ChannelStack& stack)
{
    if (stack.empty()) {
        return kEmptyStackThreshold;
    }
    return autoThreshold(stack.slice(stack.numSlices() / 2));
}

ColocParams withAutoThresholds(ColocParams params, const RgbImageSet& set)
{
    auto update = [](const std::optional<ChannelStack>& stack, int& threshold, const char* name) {
        if (stack) {
            threshold = autoThreshold(*stack);
            Logger()->info("Auto threshold for {}: {}", name, threshold);
        }
    };
    update(set.red, params.redThreshold, "red");
    update(set.green, params.greenThreshold, "green");
    update(set.blue, params.blueThreshold, "blue");
    return params;
}

}  // namespace coloc
