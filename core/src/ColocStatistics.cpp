#include "coloc/core/util/ColocStatistics.hpp"

#include <cmath>

namespace coloc {

double ratioOrUndefined(int64_t numerator, int64_t denominator)
{
    if (denominator == 0) {
        return kUndefined;
    }
    return static_cast<double>(numerator) / static_cast<double>(denominator);
}

double pearsonCoefficient(const IntensitySums& sums)
{
    const double n = static_cast<double>(sums.n);
    const double sx = static_cast<double>(sums.sum1);
    const double sy = static_cast<double>(sums.sum2);

    const double varX = n * static_cast<double>(sums.sumSq1) - sx * sx;
    const double varY = n * static_cast<double>(sums.sumSq2) - sy * sy;
    const double denom = varX * varY;
    if (!(denom > 0.0)) {
        return kUndefined;
    }

    const double cov = n * static_cast<double>(sums.sumProd) - sx * sy;
    return cov / std::sqrt(denom);
}

SliceStatistics computeStatistics(const ClassificationCounts& counts, const IntensitySums& sums)
{
    SliceStatistics s;
    s.counts = counts;

    const int64_t above = counts.aboveThresholdTotal();
    s.percentChannel1Only = ratioOrUndefined(counts.channel1Only, above) * 100.0;
    s.percentChannel2Only = ratioOrUndefined(counts.channel2Only, above) * 100.0;
    s.percentColocalized = ratioOrUndefined(counts.colocalized, above) * 100.0;

    s.channel1OverlapChannel2 = ratioOrUndefined(counts.colocalized, counts.channel1Only + counts.colocalized);
    s.channel2OverlapChannel1 = ratioOrUndefined(counts.colocalized, counts.channel2Only + counts.colocalized);

    s.pearson = pearsonCoefficient(sums);
    return s;
}

}  // namespace coloc
