#pragma once

#include <cstdint>
#include <limits>

#include "coloc/core/util/PixelClassifier.hpp"

namespace coloc {

inline constexpr double kUndefined = std::numeric_limits<double>::quiet_NaN();

// Running sums for the Pearson coefficient. Integer sums keep the
// accumulation exact; products are formed in double only at the end.
struct IntensitySums {
    int64_t sum1 = 0;
    int64_t sum2 = 0;
    int64_t sumSq1 = 0;
    int64_t sumSq2 = 0;
    int64_t sumProd = 0;
    int64_t n = 0;

    void add(int z1, int z2)
    {
        sum1 += z1;
        sum2 += z2;
        sumSq1 += int64_t(z1) * z1;
        sumSq2 += int64_t(z2) * z2;
        sumProd += int64_t(z1) * z2;
        ++n;
    }
};

struct SliceStatistics {
    ClassificationCounts counts;
    int32_t maxCount = 0;               // largest joint histogram cell

    // Relative to counts.aboveThresholdTotal(), NaN if that is 0
    double percentChannel1Only = kUndefined;
    double percentChannel2Only = kUndefined;
    double percentColocalized = kUndefined;

    // Manders-style overlap (M1/M2), NaN if the denominator is 0
    double channel1OverlapChannel2 = kUndefined;
    double channel2OverlapChannel1 = kUndefined;

    // NaN when either channel has zero variance
    double pearson = kUndefined;
};

// numerator / denominator, NaN for a zero denominator
double ratioOrUndefined(int64_t numerator, int64_t denominator);

// r = (N*Sxy - Sx*Sy) / sqrt((N*Sxx - Sx^2) * (N*Syy - Sy^2)); NaN if the product is <= 0
double pearsonCoefficient(const IntensitySums& sums);

SliceStatistics computeStatistics(const ClassificationCounts& counts, const IntensitySums& sums);

}  // namespace coloc
