#include "coloc/core/util/SliceProcessor.hpp"

#include <array>
#include <initializer_list>

#include "coloc/core/types/Errors.hpp"
#include "coloc/core/util/IntensityColorMap.hpp"
#include "coloc/core/util/PixelClassifier.hpp"

namespace coloc {

SliceOutput processSlice(const IntensityPlane& plane1, const IntensityPlane& plane2,
                         const ChannelSpec& channel1, const ChannelSpec& channel2,
                         const ColocParams& params)
{
    requireSameSize(plane1.size(), plane2.size(), channel1.label + " and " + channel2.label + " planes");

    const QuadrantPalette palette = QuadrantPalette::forChannels(channel1.color, channel2.color);
    // Indexed by PixelClass
    std::array<cv::Vec3b, 4> bgr;
    for (auto c : {PixelClass::BelowBoth, PixelClass::Channel1Only, PixelClass::Channel2Only,
                   PixelClass::Colocalized}) {
        bgr[static_cast<size_t>(c)] = palette.colorOf(c).toBgr();
    }

    const int t1 = channel1.threshold;
    const int t2 = channel2.threshold;
    const bool paintPlot = params.renderQuadrantPlot;
    const bool skipBelow = params.excludeBelowThresholdFromPearson;

    SliceOutput out;
    out.colocMask = IntensityPlane(plane1.size(), uint8_t(0));
    if (paintPlot) {
        out.quadrantPlot = newQuadrantPlot(palette);
    }

    ClassificationCounts counts;
    IntensitySums sums;

    for (int y = 0; y < plane1.rows; y++) {
        const uint8_t* row1 = plane1[y];
        const uint8_t* row2 = plane2[y];
        uint8_t* mask = out.colocMask[y];
        for (int x = 0; x < plane1.cols; x++) {
            const uint8_t z1 = row1[x];
            const uint8_t z2 = row2[x];

            out.histogram.add(z1, z2);

            const PixelClass c = classifyPixel(z1, z2, t1, t2);
            counts.add(c);
            if (paintPlot) {
                paintQuadrant(out.quadrantPlot, z1, z2, bgr[static_cast<size_t>(c)]);
            }
            if (c == PixelClass::Colocalized) {
                mask[x] = 255;
            }

            if (!(skipBelow && c == PixelClass::BelowBoth)) {
                sums.add(z1, z2);
            }
        }
    }

    if (paintPlot) {
        drawThresholdLines(out.quadrantPlot, t1, t2, palette.mark);
    }
    if (params.renderIntensityPlot) {
        out.intensityPlot = renderIntensityPlot(out.histogram);
        drawThresholdLines(out.intensityPlot, t1, t2, palette.mark);
    }

    out.stats = computeStatistics(counts, sums);
    out.stats.maxCount = out.histogram.maxCount();
    return out;
}

}  // namespace coloc
