#include <gtest/gtest.h>

#include "mosaic/errors.hpp"
#include "mosaic/packing.hpp"
#include "mosaic/utils.hpp"

#include <cmath>

namespace mosaic::test {

namespace {

// Distance between two centres in units of the ellipse axes
double normalizedDistance(const Offset& a, const Offset& b,
                          double widthH, double widthV, double angle) {
    double t = deg2rad(angle);
    double dx = a.x - b.x;
    double dy = a.y - b.y;
    double along = (dx * std::cos(t) + dy * std::sin(t)) / widthH;
    double across = (-dx * std::sin(t) + dy * std::cos(t)) / widthV;
    return std::hypot(along, across);
}

} // namespace

class PackingTest : public ::testing::Test {
protected:
    EllipsePacker packer_{2};
};

TEST_F(PackingTest, GridStartsAtBoreSight) {
    auto points = packer_.grid(0.1, 0.01, 0.005, 25.0);
    ASSERT_FALSE(points.empty());
    EXPECT_NEAR(points[0].x, 0.0, 1e-15);
    EXPECT_NEAR(points[0].y, 0.0, 1e-15);

    for (const auto& p : points) {
        EXPECT_LE(std::hypot(p.x, p.y), 0.1 + 1e-12);
    }
    for (size_t i = 1; i < points.size(); i++) {
        EXPECT_LE(std::hypot(points[i - 1].x, points[i - 1].y),
                  std::hypot(points[i].x, points[i].y) + 1e-9);
    }
}

TEST_F(PackingTest, GridNeighboursTouch) {
    double widthH = 0.01, widthV = 0.004, angle = 60.0;
    auto points = packer_.grid(0.05, widthH, widthV, angle);

    // Six nearest neighbours of the boresight beam, two widths apart
    int touching = 0;
    for (size_t i = 1; i < points.size(); i++) {
        double d = normalizedDistance(points[0], points[i], widthH, widthV, angle);
        EXPECT_GE(d, 2.0 - 1e-9);
        if (std::fabs(d - 2.0) < 1e-9) touching++;
    }
    EXPECT_EQ(touching, 6);
}

TEST_F(PackingTest, ZeroRadiusGridIsTheBoreSightBeam) {
    auto points = packer_.grid(0.0, 0.01, 0.01, 0.0);
    ASSERT_EQ(points.size(), 1u);
}

TEST_F(PackingTest, CompactReturnsExactlyTheRequestedCount) {
    for (int n : {1, 2, 7, 19, 50}) {
        PackingResult result = packer_.compact(n, 0.01, 0.006, 10.0, 4);
        EXPECT_EQ(result.coordinates.size(), static_cast<size_t>(n));
        EXPECT_GT(result.radius, 0.0);
        EXPECT_NEAR(result.radius,
                    EllipsePacker::circumscribingRadius(result.coordinates, 0.01, 0.006, 10.0),
                    1e-12);
    }
}

TEST_F(PackingTest, CompactBeamsDoNotOverlapBeyondTheirWidths) {
    double widthH = 0.02, widthV = 0.01, angle = -35.0;
    PackingResult result = packer_.compact(30, widthH, widthV, angle, 5);

    for (size_t i = 0; i < result.coordinates.size(); i++) {
        for (size_t j = i + 1; j < result.coordinates.size(); j++) {
            EXPECT_GE(normalizedDistance(result.coordinates[i], result.coordinates[j],
                                         widthH, widthV, angle),
                      2.0 - 1e-9);
        }
    }
}

TEST_F(PackingTest, CompactIsDeterministic) {
    PackingResult a = packer_.compact(40, 0.01, 0.007, 5.0, 6);
    PackingResult b = EllipsePacker(1).compact(40, 0.01, 0.007, 5.0, 6);

    ASSERT_EQ(a.coordinates.size(), b.coordinates.size());
    EXPECT_EQ(a.radius, b.radius);
    for (size_t i = 0; i < a.coordinates.size(); i++) {
        EXPECT_EQ(a.coordinates[i].x, b.coordinates[i].x);
        EXPECT_EQ(a.coordinates[i].y, b.coordinates[i].y);
    }
}

TEST_F(PackingTest, HigherPrecisionIsNeverLooser) {
    PackingResult coarse = packer_.compact(25, 0.01, 0.005, 0.0, 1);
    PackingResult fine = packer_.compact(25, 0.01, 0.005, 0.0, 4);
    EXPECT_LE(fine.radius, coarse.radius + 1e-12);
}

TEST_F(PackingTest, RejectsBadArguments) {
    EXPECT_THROW(packer_.compact(0, 0.01, 0.01, 0.0, 4), std::invalid_argument);
    EXPECT_THROW(packer_.compact(5, 0.0, 0.01, 0.0, 4), std::invalid_argument);
    EXPECT_THROW(packer_.compact(5, 0.01, 0.01, 0.0, 0), std::invalid_argument);
    EXPECT_THROW(packer_.grid(-1.0, 0.01, 0.01, 0.0), std::invalid_argument);
    EXPECT_THROW(packer_.grid(100.0, 1e-5, 1e-5, 0.0), MosaicError);
}

} // namespace mosaic::test
