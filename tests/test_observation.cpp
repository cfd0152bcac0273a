#include <gtest/gtest.h>

#include "mosaic/errors.hpp"
#include "mosaic/observation.hpp"
#include "test_helpers.hpp"

#include <cmath>

namespace mosaic::test {

class ObservationTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto& input : triangleArray()) {
            antennas_.push_back(resolveAntenna(input));
        }
    }

    std::unique_ptr<InterferometryObservation> observe(double frequency) {
        auto observation = std::make_unique<InterferometryObservation>(
            PsfSim::REFERENCE_ANTENNA, std::vector<double>{C_LIGHT / frequency},
            smallPsfOptions());
        observation->setBoreSight(transitSource());
        observation->setObserveTime(0.0);
        observation->createContour(antennas_);
        return observation;
    }

    AntennaGeometry antennas_;
};

TEST_F(ObservationTest, RejectsBadOptions) {
    PsfOptions options = smallPsfOptions();
    options.image_density = 255;
    EXPECT_THROW(InterferometryObservation(PsfSim::REFERENCE_ANTENNA, {0.21}, options),
                 std::invalid_argument);
    EXPECT_THROW(InterferometryObservation(PsfSim::REFERENCE_ANTENNA, {}, smallPsfOptions()),
                 std::invalid_argument);
}

TEST_F(ObservationTest, ContourNeedsBoreSightAndTime) {
    InterferometryObservation observation(PsfSim::REFERENCE_ANTENNA, {0.21}, smallPsfOptions());
    EXPECT_THROW(observation.createContour(antennas_), MosaicError);
    EXPECT_THROW(observation.getBeamAxis(), MosaicError);

    observation.setBoreSight(transitSource());
    EXPECT_THROW(observation.createContour(antennas_), MosaicError);
}

TEST_F(ObservationTest, BaselinesCoverBothHalvesOfTheUvPlane) {
    auto observation = observe(1.4e9);
    EXPECT_EQ(observation->getBaselinesNumber(), 3u);

    const auto& uv = observation->getProjectedBaselines();
    ASSERT_EQ(uv.size(), 6u);
    for (size_t i = 0; i < uv.size(); i += 2) {
        EXPECT_DOUBLE_EQ(uv[i][0], -uv[i + 1][0]);
        EXPECT_DOUBLE_EQ(uv[i][1], -uv[i + 1][1]);
    }
}

TEST_F(ObservationTest, PsfPeaksAtCentreAndIsSymmetric) {
    auto observation = observe(1.4e9);
    auto psf = observation->getPointSpreadFunction();
    ASSERT_NE(psf, nullptr);

    const int n = psf->nx;
    ASSERT_EQ(n, 256);
    EXPECT_FLOAT_EQ(psf->image[static_cast<size_t>(n / 2) * n + n / 2], 1.0f);

    for (int y = 1; y < n; y += 7) {
        for (int x = 1; x < n; x += 5) {
            EXPECT_NEAR(psf->image[static_cast<size_t>(y) * n + x],
                        psf->image[static_cast<size_t>(n - y) * n + (n - x)], 1e-4);
            EXPECT_LE(psf->image[static_cast<size_t>(y) * n + x], 1.0f + 1e-4f);
        }
    }

    EXPECT_DOUBLE_EQ(observation->getImageLength(), psf->width);
}

TEST_F(ObservationTest, BeamAxisFollowsWavelength) {
    auto low = observe(1.4e9);
    auto high = observe(2.8e9);

    BeamAxis a = low->getBeamAxis();
    BeamAxis b = high->getBeamAxis();

    EXPECT_GT(a.axisV, 0.0);
    EXPECT_GE(a.axisH, a.axisV);
    EXPECT_NEAR(b.axisH / a.axisH, 0.5, 1e-6);
    EXPECT_NEAR(b.axisV / a.axisV, 0.5, 1e-6);
    EXPECT_NEAR(b.angle, a.angle, 1e-9);

    auto [az, el] = low->getHorizontal();
    EXPECT_GT(rad2deg(el), 80.0);
    EXPECT_GE(az, 0.0);
}

TEST_F(ObservationTest, CoLocatedAntennasHaveNoBeam) {
    AntennaGeometry stacked(3, PsfSim::REFERENCE_ANTENNA);
    InterferometryObservation observation(PsfSim::REFERENCE_ANTENNA, {0.21}, smallPsfOptions());
    observation.setBoreSight(transitSource());
    observation.setObserveTime(0.0);
    EXPECT_THROW(observation.createContour(stacked), MosaicError);
}

TEST_F(ObservationTest, CollinearAntennasHaveNoBeam) {
    AntennaGeometry line;
    for (double east : {0.0, 500.0, 1000.0}) {
        line.push_back(offsetAntenna(east, 0.0));
    }
    InterferometryObservation observation(PsfSim::REFERENCE_ANTENNA, {0.21}, smallPsfOptions());
    observation.setBoreSight(transitSource());
    observation.setObserveTime(0.0);
    EXPECT_THROW(observation.createContour(line), MosaicError);
    EXPECT_THROW(observation.getBeamAxis(), MosaicError);
}

} // namespace mosaic::test
