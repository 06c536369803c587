#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

#include "coloc/core/types/ChannelStack.hpp"
#include "coloc/core/types/Color.hpp"
#include "coloc/core/types/ColocParams.hpp"

namespace coloc {

enum class PixelClass : uint8_t {
    BelowBoth = 0,
    Channel1Only,
    Channel2Only,
    Colocalized
};

// Exactly one class for every (z1, z2) and threshold pair
inline PixelClass classifyPixel(int z1, int z2, int threshold1, int threshold2)
{
    const bool above1 = z1 >= threshold1;
    const bool above2 = z2 >= threshold2;
    if (above1 && above2) return PixelClass::Colocalized;
    if (above1) return PixelClass::Channel1Only;
    if (above2) return PixelClass::Channel2Only;
    return PixelClass::BelowBoth;
}

struct ClassificationCounts {
    int64_t belowBoth = 0;
    int64_t channel1Only = 0;
    int64_t channel2Only = 0;
    int64_t colocalized = 0;

    void add(PixelClass c)
    {
        switch (c) {
            case PixelClass::BelowBoth:    ++belowBoth; break;
            case PixelClass::Channel1Only: ++channel1Only; break;
            case PixelClass::Channel2Only: ++channel2Only; break;
            case PixelClass::Colocalized:  ++colocalized; break;
        }
    }

    [[nodiscard]] int64_t aboveThresholdTotal() const { return channel1Only + channel2Only + colocalized; }
    [[nodiscard]] int64_t total() const { return belowBoth + aboveThresholdTotal(); }
};

// Colours of the quadrant plot
struct QuadrantPalette {
    RgbColor belowBoth = colors::Gray;
    RgbColor channel1 = colors::Red;
    RgbColor channel2 = colors::Blue;
    RgbColor colocalized = RgbColor::fromHex(0x990099);
    RgbColor mark = colors::Black;          // threshold lines
    RgbColor background = colors::White;    // intensity pairs that never occur

    static QuadrantPalette forChannels(const RgbColor& c1, const RgbColor& c2);

    [[nodiscard]] const RgbColor& colorOf(PixelClass c) const
    {
        switch (c) {
            case PixelClass::Channel1Only: return channel1;
            case PixelClass::Channel2Only: return channel2;
            case PixelClass::Colocalized:  return colocalized;
            case PixelClass::BelowBoth:    break;
        }
        return belowBoth;
    }
};

// Per-component (c1 + c2) * 0.6, truncated and clamped to 255
RgbColor mixColocColor(const RgbColor& c1, const RgbColor& c2);

// 256x256 plot filled with the palette background
ColorPlane newQuadrantPlot(const QuadrantPalette& palette);

// Marks intensity pair (z1, z2) at raster position (column z1, row 255 - z2)
inline void paintQuadrant(ColorPlane& plot, int z1, int z2, const cv::Vec3b& bgr)
{
    plot(kMaxIntensity - z2, z1) = bgr;
}

// Horizontal line at row 255 - threshold2 and vertical line at column threshold1.
// Thresholds outside 0..255 draw no line.
void drawThresholdLines(ColorPlane& plot, int threshold1, int threshold2, const RgbColor& mark);

struct Classification {
    ClassificationCounts counts;
    ColorPlane quadrantPlot;        // 256x256, intensity space
    IntensityPlane colocMask;       // pixel space, 255 where colocalized
};

// Classifies every pixel pair of two planes.
// Throws DimensionMismatch before reading any pixel if the planes differ in size.
Classification classifyPixels(const IntensityPlane& plane1, const IntensityPlane& plane2,
                              const ChannelSpec& channel1, const ChannelSpec& channel2);

}  // namespace coloc
