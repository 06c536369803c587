#include "test.hpp"
#include "planes.hpp"

#include "coloc/core/types/Errors.hpp"
#include "coloc/core/util/PixelClassifier.hpp"

using namespace coloc;

namespace {

const ChannelSpec kRed{"Red", 75, colors::Red};
const ChannelSpec kBlue{"Blue", 75, colors::Blue};

}  // namespace

TEST(PixelClassifier, ThresholdIsInclusive)
{
    EXPECT_TRUE(classifyPixel(75, 75, 75, 75) == PixelClass::Colocalized);
    EXPECT_TRUE(classifyPixel(75, 74, 75, 75) == PixelClass::Channel1Only);
    EXPECT_TRUE(classifyPixel(74, 75, 75, 75) == PixelClass::Channel2Only);
    EXPECT_TRUE(classifyPixel(74, 74, 75, 75) == PixelClass::BelowBoth);
}

TEST(PixelClassifier, ZeroThresholdColocalizesEverything)
{
    IntensityPlane p1(5, 5);
    IntensityPlane p2(5, 5);
    cv::randu(p1, cv::Scalar(0), cv::Scalar(256));
    cv::randu(p2, cv::Scalar(0), cv::Scalar(256));

    const ChannelSpec c1{"Red", 0, colors::Red};
    const ChannelSpec c2{"Blue", 0, colors::Blue};
    auto cls = classifyPixels(p1, p2, c1, c2);
    EXPECT_EQ(cls.counts.colocalized, 25);
    EXPECT_EQ(cls.counts.belowBoth, 0);
    EXPECT_EQ(cv::countNonZero(cls.colocMask), 25);
}

TEST(PixelClassifier, ThresholdAboveRangeClassifiesNothingAbove)
{
    auto p = constantPlane(3, 3, 255);
    const ChannelSpec c1{"Red", 256, colors::Red};
    const ChannelSpec c2{"Blue", 256, colors::Blue};
    auto cls = classifyPixels(p, p, c1, c2);
    EXPECT_EQ(cls.counts.belowBoth, 9);
    EXPECT_EQ(cls.counts.aboveThresholdTotal(), 0);
}

TEST(PixelClassifier, CountsCoverEveryPixel)
{
    IntensityPlane p1(9, 11);
    IntensityPlane p2(9, 11);
    cv::randu(p1, cv::Scalar(0), cv::Scalar(256));
    cv::randu(p2, cv::Scalar(0), cv::Scalar(256));

    auto cls = classifyPixels(p1, p2, kRed, kBlue);
    EXPECT_EQ(cls.counts.total(), 99);
}

TEST(PixelClassifier, MaskMarksColocalizedPixels)
{
    auto p1 = makePlane(1, 4, {200, 200, 10, 10});
    auto p2 = makePlane(1, 4, {200, 10, 200, 10});
    auto cls = classifyPixels(p1, p2, kRed, kBlue);

    EXPECT_EQ(cls.counts.colocalized, 1);
    EXPECT_EQ(cls.counts.channel1Only, 1);
    EXPECT_EQ(cls.counts.channel2Only, 1);
    EXPECT_EQ(cls.counts.belowBoth, 1);
    EXPECT_EQ(cls.colocMask(0, 0), 255);
    EXPECT_EQ(cls.colocMask(0, 1), 0);
    EXPECT_EQ(cls.colocMask(0, 2), 0);
    EXPECT_EQ(cls.colocMask(0, 3), 0);
}

TEST(PixelClassifier, QuadrantPlotColours)
{
    auto p1 = makePlane(1, 4, {200, 200, 10, 10});
    auto p2 = makePlane(1, 4, {200, 10, 200, 10});
    auto cls = classifyPixels(p1, p2, kRed, kBlue);
    const auto& plot = cls.quadrantPlot;

    EXPECT_EQ(plot(255 - 200, 200), RgbColor::fromHex(0x990099).toBgr());
    EXPECT_EQ(plot(255 - 10, 200), colors::Red.toBgr());
    EXPECT_EQ(plot(255 - 200, 10), colors::Blue.toBgr());
    EXPECT_EQ(plot(255 - 10, 10), colors::Gray.toBgr());
    // untouched cell
    EXPECT_EQ(plot(0, 0), colors::White.toBgr());
    // threshold lines
    EXPECT_EQ(plot(255 - 75, 0), colors::Black.toBgr());
    EXPECT_EQ(plot(0, 75), colors::Black.toBgr());
}

TEST(PixelClassifier, PaletteColorOfClass)
{
    auto palette = QuadrantPalette::forChannels(colors::Red, colors::Green);
    EXPECT_EQ(palette.colorOf(PixelClass::BelowBoth), colors::Gray);
    EXPECT_EQ(palette.colorOf(PixelClass::Channel1Only), colors::Red);
    EXPECT_EQ(palette.colorOf(PixelClass::Channel2Only), colors::Green);
    EXPECT_EQ(palette.colorOf(PixelClass::Colocalized), mixColocColor(colors::Red, colors::Green));
}

TEST(PixelClassifier, MixColocColor)
{
    EXPECT_EQ(mixColocColor(colors::Red, colors::Blue), RgbColor(153, 0, 153));
    EXPECT_EQ(mixColocColor(colors::Red, colors::Green), RgbColor(153, 153, 0));
    EXPECT_EQ(mixColocColor(colors::White, colors::White), colors::White);
    EXPECT_EQ(mixColocColor(colors::Blue, colors::Orange), RgbColor(153, 76, 153));
}

TEST(PixelClassifier, ThresholdLinesOutOfRangeAreSkipped)
{
    QuadrantPalette palette;
    auto plot = newQuadrantPlot(palette);
    drawThresholdLines(plot, 256, 256, colors::Black);
    EXPECT_EQ(cv::countNonZero(plot.reshape(1) != 255), 0);

    drawThresholdLines(plot, 0, 256, colors::Black);
    EXPECT_EQ(plot(0, 0), colors::Black.toBgr());
    EXPECT_EQ(plot(255, 0), colors::Black.toBgr());
    EXPECT_EQ(plot(0, 1), colors::White.toBgr());
}

TEST(PixelClassifier, MismatchedPlanesThrow)
{
    auto p1 = constantPlane(2, 2, 100);
    auto p2 = constantPlane(3, 2, 100);
    EXPECT_THROW(classifyPixels(p1, p2, kRed, kBlue), DimensionMismatch);
}
