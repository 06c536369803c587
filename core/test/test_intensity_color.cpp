#include "test.hpp"

#include <cmath>
#include <limits>

#include "coloc/core/util/IntensityColorMap.hpp"

using namespace coloc;

namespace {

bool near(const RgbColor& c, int r, int g, int b, int tol = 1)
{
    return std::abs(int(c.r) - r) <= tol && std::abs(int(c.g) - g) <= tol && std::abs(int(c.b) - b) <= tol;
}

}  // namespace

TEST(IntensityColorMap, Endpoints)
{
    EXPECT_EQ(intensityColor(0.0), colors::Black);
    EXPECT_EQ(intensityColor(1.0), RgbColor(255, 252, 246));
}

TEST(IntensityColorMap, Breakpoints)
{
    EXPECT_TRUE(near(intensityColor(0.1), 188, 110, 209));
    EXPECT_TRUE(near(intensityColor(0.7), 255, 174, 0));
}

TEST(IntensityColorMap, InteriorOfSegments)
{
    EXPECT_TRUE(near(intensityColor(0.05), 94, 55, 104));
    EXPECT_TRUE(near(intensityColor(0.4), 221, 142, 104));
    EXPECT_TRUE(near(intensityColor(0.85), 255, 213, 123));
}

TEST(IntensityColorMap, OutOfRangeIsClamped)
{
    EXPECT_EQ(intensityColor(-0.5), colors::Black);
    EXPECT_EQ(intensityColor(3.0), RgbColor(255, 252, 246));
    EXPECT_EQ(intensityColor(std::numeric_limits<double>::quiet_NaN()), colors::Black);
}

TEST(IntensityColorMap, LogCountRatio)
{
    EXPECT_NEAR(logCountRatio(0, 10), 0.0, 1e-12);
    EXPECT_NEAR(logCountRatio(9, 10), 1.0, 1e-12);
    EXPECT_NEAR(logCountRatio(10, 10), 1.0, 1e-12);
    EXPECT_NEAR(logCountRatio(1, 100), std::log(2.0) / std::log(100.0), 1e-12);
}

TEST(IntensityColorMap, SingleCountHistogram)
{
    EXPECT_NEAR(logCountRatio(1, 1), 1.0, 1e-12);
    EXPECT_NEAR(logCountRatio(0, 1), 0.0, 1e-12);
    EXPECT_NEAR(logCountRatio(0, 0), 0.0, 1e-12);
}

TEST(IntensityColorMap, RenderedPlotLayout)
{
    JointHistogram h;
    h.add(3, 7);
    auto plot = renderIntensityPlot(h);

    EXPECT_EQ(plot.rows, 256);
    EXPECT_EQ(plot.cols, 256);
    EXPECT_EQ(plot(255 - 7, 3), RgbColor(255, 252, 246).toBgr());
    EXPECT_EQ(plot(7, 3), colors::Black.toBgr());
    EXPECT_EQ(plot(0, 0), colors::Black.toBgr());
}
