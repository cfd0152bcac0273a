#include <gtest/gtest.h>

#include "mosaic/errors.hpp"
#include "mosaic/tiling.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>

namespace mosaic::test {

class TilingTest : public ::testing::Test {
protected:
    void SetUp() override {
        shape_ = makeBeamShape(0.02, 0.01, 30.0, EquatorialCoordinate{200.0, -45.0});
        overlap_options_.grid_size = 121;
        overlap_options_.num_threads = 2;
    }

    std::shared_ptr<const BeamShape> shape_;
    EllipsePacker packer_{2};
    OverlapOptions overlap_options_;
};

TEST_F(TilingTest, BeamCountTilingHasExactlyNBeams) {
    for (int n : {1, 7, 36}) {
        Tiling tiling = generateNBeamsTiling(shape_, n, 0.5, packer_, 4);
        EXPECT_EQ(tiling.beamNum(), static_cast<size_t>(n));
        EXPECT_EQ(tiling.coordinates().size(), tiling.beamNum());
        EXPECT_GT(tiling.tilingRadius(), 0.0);
        EXPECT_DOUBLE_EQ(tiling.overlap(), 0.5);
    }
}

TEST_F(TilingTest, DefaultPackerMatchesExplicitPacker) {
    Tiling implicit = generateNBeamsTiling(shape_, 12);
    Tiling stated = generateNBeamsTiling(shape_, 12, 0.5, EllipsePacker(), 10);
    EXPECT_EQ(implicit.beamNum(), 12u);
    EXPECT_EQ(implicit.tilingRadius(), stated.tilingRadius());

    Tiling grid = generateRadiusTiling(shape_, 0.08);
    EXPECT_DOUBLE_EQ(grid.overlap(), 0.5);
    EXPECT_EQ(grid.beamNum(), generateRadiusTiling(shape_, 0.08, 0.5, packer_).beamNum());
}

TEST_F(TilingTest, RadiusTilingKeepsBeamsInside) {
    Tiling tiling = generateRadiusTiling(shape_, 0.1, 0.7, packer_);
    EXPECT_EQ(tiling.coordinates().size(), tiling.beamNum());
    EXPECT_DOUBLE_EQ(tiling.tilingRadius(), 0.1);
    ASSERT_GT(tiling.beamNum(), 1u);
    EXPECT_EQ(tiling.coordinates()[0].x, 0.0);
    EXPECT_EQ(tiling.coordinates()[0].y, 0.0);
    for (const auto& c : tiling.coordinates()) {
        EXPECT_LE(std::hypot(c.x, c.y), 0.1 + 1e-12);
    }
}

TEST_F(TilingTest, HigherOverlapPacksMoreBeams) {
    Tiling loose = generateRadiusTiling(shape_, 0.1, 0.2, packer_);
    Tiling dense = generateRadiusTiling(shape_, 0.1, 0.8, packer_);
    EXPECT_GT(dense.beamNum(), loose.beamNum());
}

TEST_F(TilingTest, WidthsMatchTheBeamShape) {
    Tiling tiling = generateNBeamsTiling(shape_, 10, 0.4, packer_, 3);
    auto widths = tiling.widths();
    auto expected = shape_->widthAtOverlap(0.4);
    EXPECT_EQ(widths.first, expected.first);
    EXPECT_EQ(widths.second, expected.second);
}

TEST_F(TilingTest, OverlapFractionsSumToOne) {
    Tiling tiling = generateNBeamsTiling(shape_, 19, 0.5, packer_, 4);
    Overlap overlap = tiling.calculateOverlap(OverlapMode::COUNTER, nullptr, overlap_options_);
    OverlapFractions f = overlap.calculateFractions();
    EXPECT_NEAR(f.overlapped + f.non_overlapped + f.empty, 1.0, 1e-12);
    EXPECT_GT(f.non_overlapped, 0.0);

    Overlap heater = tiling.skyPattern(overlap_options_);
    EXPECT_THROW(heater.calculateFractions(), UnsupportedModeError);
}

TEST_F(TilingTest, LargerBeamOverridesIncreaseOverlap) {
    Tiling tiling = generateNBeamsTiling(shape_, 19, 0.5, packer_, 4);

    Overlap own = tiling.calculateOverlap(OverlapMode::COUNTER, nullptr, overlap_options_);
    Overlap same = tiling.calculateOverlap(OverlapMode::COUNTER, shape_, overlap_options_);
    EXPECT_EQ(own.metrics().values, same.metrics().values);

    auto wider = makeBeamShape(0.03, 0.015, 30.0, shape_->boreSight());
    Overlap grown = tiling.calculateOverlap(OverlapMode::COUNTER, wider, overlap_options_);
    EXPECT_GT(grown.calculateFractions().overlapped, own.calculateFractions().overlapped);
}

TEST_F(TilingTest, EquatorialCoordinatesStartAtBoreSight) {
    Tiling tiling = generateNBeamsTiling(shape_, 7, 0.5, packer_, 1);
    auto equatorial = tiling.equatorialCoordinates();
    ASSERT_EQ(equatorial.size(), 7u);

    // precision 1 packs on the unshifted lattice, whose first point is the boresight
    EXPECT_DOUBLE_EQ(equatorial[0].ra, 200.0);
    EXPECT_DOUBLE_EQ(equatorial[0].dec, -45.0);
    for (size_t i = 1; i < equatorial.size(); i++) {
        EXPECT_NEAR(equatorial[i].dec, -45.0, 0.1);
    }
}

TEST_F(TilingTest, RejectsInvalidArguments) {
    EXPECT_THROW(generateNBeamsTiling(shape_, 10, 1.2, packer_), InvalidOverlapError);
    EXPECT_THROW(generateRadiusTiling(shape_, 0.1, 0.0, packer_), InvalidOverlapError);
    EXPECT_THROW(generateNBeamsTiling(nullptr, 10, 0.5, packer_), std::invalid_argument);
    EXPECT_THROW(Tiling({}, shape_, -1.0, 0.5), std::invalid_argument);
}

TEST_F(TilingTest, LineBeamOverrideIsRejected) {
    Tiling tiling = generateNBeamsTiling(shape_, 7, 0.5, packer_, 2);
    auto line = makeBeamShape(0.02, 0.0, 30.0, shape_->boreSight());
    EXPECT_THROW(tiling.calculateOverlap(OverlapMode::COUNTER, line, overlap_options_),
                 MosaicError);
    EXPECT_THROW(generateRadiusTiling(line, 0.05, 0.5, packer_), MosaicError);
}

TEST_F(TilingTest, WritesTilingFile) {
    Tiling tiling = generateNBeamsTiling(shape_, 5, 0.5, packer_, 2);
    const std::string path = "mosaic_test_tiling.txt";
    ASSERT_TRUE(writeTilingFile(path, tiling));

    std::ifstream file(path);
    std::string line;
    int beams = 0;
    while (std::getline(file, line)) {
        if (!line.empty() && line[0] != '#') beams++;
    }
    EXPECT_EQ(beams, 5);
    std::filesystem::remove(path);
}

} // namespace mosaic::test
