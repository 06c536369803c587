#include "test.hpp"
#include "planes.hpp"

#include "coloc/core/util/AutoThreshold.hpp"

using namespace coloc;

TEST(AutoThreshold, TwoPopulations)
{
    IntensityHistogram h{};
    h[50] = 100;
    h[200] = 100;
    EXPECT_EQ(autoThreshold(h), 125);
}

TEST(AutoThreshold, IgnoresSaturatedBins)
{
    IntensityHistogram h{};
    h[0] = 100000;
    h[255] = 100000;
    h[50] = 100;
    h[200] = 100;
    EXPECT_EQ(autoThreshold(h), 125);
}

TEST(AutoThreshold, DegenerateHistogram)
{
    IntensityHistogram h{};
    EXPECT_EQ(autoThreshold(h), 128);
    h[90] = 10;
    EXPECT_EQ(autoThreshold(h), 128);
    h[0] = 10;
    h[255] = 10;
    EXPECT_EQ(autoThreshold(h), 128);
}

TEST(AutoThreshold, PlaneHistogram)
{
    auto p = splitPlane(200, 10);
    auto h = intensityHistogram(p);
    EXPECT_EQ(h[200], 8);
    EXPECT_EQ(h[10], 8);
    EXPECT_EQ(autoThreshold(p), 105);
}

TEST(AutoThreshold, StackUsesMiddleSlice)
{
    std::vector<IntensityPlane> slices{splitPlane(255, 0), splitPlane(200, 10), splitPlane(255, 0)};
    ChannelStack stack("s", slices);
    EXPECT_EQ(autoThreshold(stack), 105);
    EXPECT_EQ(autoThreshold(ChannelStack()), 75);
}

TEST(AutoThreshold, ReplacesThresholdsOfPresentChannels)
{
    ColocParams params;
    params.blueThreshold = 42;

    RgbImageSet set;
    set.red = repeatStack("img.tif", splitPlane(200, 10), 1);
    set.green = repeatStack("img.tif", splitPlane(150, 50), 1);
    auto p = withAutoThresholds(params, set);

    EXPECT_EQ(p.redThreshold, 105);
    EXPECT_EQ(p.greenThreshold, 100);
    EXPECT_EQ(p.blueThreshold, 42);
    EXPECT_EQ(p.maskThreshold, params.maskThreshold);
}
