#include "coloc/core/util/PixelClassifier.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>

#include "coloc/core/types/Errors.hpp"

namespace coloc {

namespace {

uint8_t mixComponent(uint8_t a, uint8_t b)
{
    int v = static_cast<int>((int(a) + int(b)) * 0.6);
    return static_cast<uint8_t>(std::min(v, 255));
}

}  // namespace

QuadrantPalette QuadrantPalette::forChannels(const RgbColor& c1, const RgbColor& c2)
{
    QuadrantPalette p;
    p.channel1 = c1;
    p.channel2 = c2;
    p.colocalized = mixColocColor(c1, c2);
    return p;
}

RgbColor mixColocColor(const RgbColor& c1, const RgbColor& c2)
{
    return {mixComponent(c1.r, c2.r), mixComponent(c1.g, c2.g), mixComponent(c1.b, c2.b)};
}

ColorPlane newQuadrantPlot(const QuadrantPalette& palette)
{
    return ColorPlane(kIntensityLevels, kIntensityLevels, palette.background.toBgr());
}

void drawThresholdLines(ColorPlane& plot, int threshold1, int threshold2, const RgbColor& mark)
{
    const cv::Vec3b bgr = mark.toBgr();
    const bool rowInRange = threshold2 >= 0 && threshold2 <= kMaxIntensity;
    const bool colInRange = threshold1 >= 0 && threshold1 <= kMaxIntensity;

    for (int j = 0; j < kIntensityLevels; j++) {
        if (rowInRange) {
            plot(kMaxIntensity - threshold2, j) = bgr;
        }
        if (colInRange) {
            plot(j, threshold1) = bgr;
        }
    }
}

Classification classifyPixels(const IntensityPlane& plane1, const IntensityPlane& plane2,
                              const ChannelSpec& channel1, const ChannelSpec& channel2)
{
    requireSameSize(plane1.size(), plane2.size(), channel1.label + " and " + channel2.label + " planes");

    const QuadrantPalette palette = QuadrantPalette::forChannels(channel1.color, channel2.color);
    // Indexed by PixelClass
    std::array<cv::Vec3b, 4> bgr;
    for (auto c : {PixelClass::BelowBoth, PixelClass::Channel1Only, PixelClass::Channel2Only,
                   PixelClass::Colocalized}) {
        bgr[static_cast<size_t>(c)] = palette.colorOf(c).toBgr();
    }

    Classification out;
    out.quadrantPlot = newQuadrantPlot(palette);
    out.colocMask = IntensityPlane(plane1.size(), uint8_t(0));

    for (int y = 0; y < plane1.rows; y++) {
        const uint8_t* row1 = plane1[y];
        const uint8_t* row2 = plane2[y];
        uint8_t* mask = out.colocMask[y];
        for (int x = 0; x < plane1.cols; x++) {
            const int z1 = row1[x];
            const int z2 = row2[x];
            const PixelClass c = classifyPixel(z1, z2, channel1.threshold, channel2.threshold);
            out.counts.add(c);
            paintQuadrant(out.quadrantPlot, z1, z2, bgr[static_cast<size_t>(c)]);
            if (c == PixelClass::Colocalized) {
                mask[x] = 255;
            }
        }
    }

    drawThresholdLines(out.quadrantPlot, channel1.threshold, channel2.threshold, palette.mark);
    return out;
}

}  // namespace coloc
