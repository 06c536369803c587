#include "test.hpp"
#include "planes.hpp"

#include "coloc/core/types/Errors.hpp"
#include "coloc/core/util/JointHistogram.hpp"

using namespace coloc;

TEST(JointHistogram, StartsEmpty)
{
    JointHistogram h;
    EXPECT_EQ(h.counts().rows, 256);
    EXPECT_EQ(h.counts().cols, 256);
    EXPECT_EQ(h.total(), 0);
    EXPECT_EQ(h.maxCount(), 0);
}

TEST(JointHistogram, CountsPairsAtChannelOneRow)
{
    auto p1 = makePlane(1, 3, {10, 10, 200});
    auto p2 = makePlane(1, 3, {20, 20, 30});
    auto h = buildJointHistogram(p1, p2);

    EXPECT_EQ(h.count(10, 20), 2);
    EXPECT_EQ(h.count(200, 30), 1);
    EXPECT_EQ(h.count(20, 10), 0);
    EXPECT_EQ(h.maxCount(), 2);
}

TEST(JointHistogram, TotalEqualsPixelCount)
{
    IntensityPlane p1(7, 13);
    IntensityPlane p2(7, 13);
    cv::randu(p1, cv::Scalar(0), cv::Scalar(256));
    cv::randu(p2, cv::Scalar(0), cv::Scalar(256));

    auto h = buildJointHistogram(p1, p2);
    EXPECT_EQ(h.total(), 7 * 13);
}

TEST(JointHistogram, IdenticalPlanesStayOnDiagonal)
{
    auto p = splitPlane(200, 10);
    auto h = buildJointHistogram(p, p);
    EXPECT_EQ(h.count(200, 200), 8);
    EXPECT_EQ(h.count(10, 10), 8);
    EXPECT_EQ(h.total(), 16);
}

TEST(JointHistogram, RasterPutsChannelTwoUp)
{
    JointHistogram h;
    h.add(3, 7);
    h.add(3, 7);
    auto r = h.toRaster();
    EXPECT_EQ(r.rows, 256);
    EXPECT_FLOAT_EQ(r(255 - 7, 3), 2.0f);
    EXPECT_FLOAT_EQ(r(7, 3), 0.0f);
}

TEST(JointHistogram, MismatchedPlanesThrow)
{
    auto p1 = constantPlane(4, 4, 1);
    auto p2 = constantPlane(4, 5, 1);
    EXPECT_THROW(buildJointHistogram(p1, p2), DimensionMismatch);
}
