#include <gtest/gtest.h>

#include "mosaic/utils.hpp"

#include <cmath>

namespace mosaic::test {

TEST(UtilsTest, SplitTrimsAndDropsEmptyFields) {
    auto parts = split(" 1.4e9 , 1.2e9,, 0.9e9 ", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "1.4e9");
    EXPECT_EQ(parts[1], "1.2e9");
    EXPECT_EQ(parts[2], "0.9e9");
}

TEST(UtilsTest, ParseKeyValueStripsComment) {
    std::string key, value;
    ASSERT_TRUE(parseKeyValue("OVERLAP   0.7   ! fraction of peak", key, value));
    EXPECT_EQ(key, "OVERLAP");
    EXPECT_EQ(value, "0.7");

    EXPECT_FALSE(parseKeyValue("OVERLAP", key, value));
    EXPECT_FALSE(parseKeyValue("OVERLAP   ! nothing", key, value));
}

TEST(UtilsTest, NormInverseAtHalfPeakIsHalfWidth) {
    double sigma = 2.0;
    double hwhm = sigma * FWHM_TO_SIGMA / 2.0;
    EXPECT_NEAR(normInverse(0.5, 0.0, sigma), hwhm, 1e-12);
    EXPECT_NEAR(normInverse(0.5, 1.0, sigma), 1.0 + hwhm, 1e-12);
    EXPECT_DOUBLE_EQ(normInverse(1.0, 0.0, sigma), 0.0);
}

TEST(UtilsTest, EllipticalGaussianFollowsRotation) {
    EXPECT_DOUBLE_EQ(ellipticalGaussian(0.0, 0.0, 1.0, 0.5, 30.0), 1.0);

    // One sigma along each rotated axis
    double t = deg2rad(30.0);
    EXPECT_NEAR(ellipticalGaussian(2.0 * std::cos(t), 2.0 * std::sin(t), 2.0, 0.5, 30.0),
                std::exp(-0.5), 1e-12);
    EXPECT_NEAR(ellipticalGaussian(-0.5 * std::sin(t), 0.5 * std::cos(t), 2.0, 0.5, 30.0),
                std::exp(-0.5), 1e-12);
}

} // namespace mosaic::test
