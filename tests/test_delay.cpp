#include <gtest/gtest.h>

#include "mosaic/delay.hpp"
#include "mosaic/errors.hpp"
#include "mosaic/tiling.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <vector>

namespace mosaic::test {

namespace {

// Encodes target, channel and timestamp into the returned delays
class FakeOracle : public DelayOracle {
public:
    FakeOracle(size_t channels, size_t samples) : channels_(channels), samples_(samples) {}

    DelayCorrections corrections(const Target& target,
                                 std::pair<double, double> window) const override {
        DelayCorrections result;
        for (size_t ch = 0; ch < channels_; ch++) {
            result.channel_ids.push_back("in" + std::to_string(ch));
            std::vector<DelaySample> samples;
            for (size_t s = 0; s < samples_; s++) {
                double delay = target.ra * (ch + 1) + 100.0 * s;
                samples.push_back({delay, window.second - window.first, 0.0});
            }
            result.samples.push_back(samples);
        }
        return result;
    }

private:
    size_t channels_;
    size_t samples_;
};

std::vector<AntennaInput> fourAntennas() {
    return {offsetAntenna(0.0, 0.0), offsetAntenna(1000.0, 0.0),
            offsetAntenna(0.0, 1000.0), offsetAntenna(-700.0, -300.0)};
}

std::vector<TargetInput> offsetTargets(const EquatorialCoordinate& centre) {
    return {centre,
            EquatorialCoordinate{centre.ra + 0.05, centre.dec},
            EquatorialCoordinate{centre.ra, centre.dec - 0.05},
            std::string("radec, 08:00:00, -40:00:00")};
}

} // namespace

TEST(DelayTest, FirstRowIsZero) {
    DelayPolynomial poly(fourAntennas(), offsetTargets(transitSource()),
                         PsfSim::REFERENCE_ANTENNA);
    DelayTable table = poly.getDelayPolynomials(0.0);

    ASSERT_EQ(table.n_targets, 4u);
    ASSERT_EQ(table.n_antennas, 4u);
    for (size_t a = 0; a < table.n_antennas; a++) {
        EXPECT_EQ(table(0, a).delay, 0.0);
        EXPECT_EQ(table(0, a).rate, 0.0);
    }

    // Offset beams need a non-zero steering delay on the long baselines
    EXPECT_NE(table(1, 1).delay, 0.0);
    EXPECT_NE(table(2, 2).delay, 0.0);
}

TEST(DelayTest, BoreSightOnlyTargetsGiveZeroTable) {
    EquatorialCoordinate bore = transitSource();
    DelayPolynomial poly(fourAntennas(), {bore, bore, bore}, PsfSim::REFERENCE_ANTENNA);
    DelayTable table = poly.getDelayPolynomials(0.0, 10.0);

    for (const auto& terms : table.values) {
        EXPECT_EQ(terms.delay, 0.0);
        EXPECT_EQ(terms.rate, 0.0);
    }
}

TEST(DelayTest, GeometricDelaysAreBoundedByBaselines) {
    GeometricDelayCorrection oracle(
        {PsfSim::REFERENCE_ANTENNA, offsetAntenna(1000.0, 0.0)},
        PsfSim::REFERENCE_ANTENNA, 1.4e9, 2);

    Target target = Target::fromEquatorial(transitSource());
    DelayCorrections corr = oracle.corrections(target, {0.0, 10.0});

    ASSERT_EQ(corr.samples.size(), 4u);
    ASSERT_EQ(corr.channel_ids.size(), 4u);
    for (const auto& channel : corr.samples) {
        ASSERT_EQ(channel.size(), 2u);
    }

    // Reference antenna against itself
    EXPECT_EQ(corr.samples[0][0].delay, 0.0);

    const DelaySample& east = corr.samples[2][0];
    EXPECT_LE(std::fabs(east.delay), 1010.0 / C_LIGHT);
    EXPECT_NE(east.rate, 0.0);
    EXPECT_NEAR(east.phase, 2.0 * PI * 1.4e9 * east.delay, 1e-9);
    EXPECT_NEAR(corr.samples[2][1].delay - east.delay, east.rate * 10.0, 1e-18);

    // Both polarizations of one antenna carry the same geometry
    EXPECT_EQ(corr.samples[3][1].delay, corr.samples[2][1].delay);
}

TEST(DelayTest, PolicySelectsChannelAndSample) {
    DelaySelectionPolicy policy;
    policy.polarizations = 2;
    policy.polarization_index = 1;
    policy.sample_index = 1;

    std::vector<TargetInput> targets = {EquatorialCoordinate{10.0, -30.0},
                                        EquatorialCoordinate{20.0, -30.0}};
    auto oracle = std::make_shared<FakeOracle>(6, 2);
    DelayPolynomial poly(triangleArray(), targets, PsfSim::REFERENCE_ANTENNA, 1.4e9,
                         policy, oracle);
    DelayTable table = poly.getDelayPolynomials(100.0, 5.0);

    double dra = deg2rad(20.0) - deg2rad(10.0);
    for (size_t a = 0; a < 3; a++) {
        size_t channel = a * 2 + 1;
        EXPECT_NEAR(table(1, a).delay, dra * (channel + 1), 1e-12);
        EXPECT_EQ(table(1, a).rate, 0.0);
    }
}

TEST(DelayTest, AntennaOrderIsPreserved) {
    std::vector<AntennaInput> forward = {offsetAntenna(1000.0, 0.0), offsetAntenna(0.0, 1000.0)};
    std::vector<AntennaInput> reversed = {forward[1], forward[0]};
    auto targets = offsetTargets(transitSource());

    DelayTable a = DelayPolynomial(forward, targets, PsfSim::REFERENCE_ANTENNA)
                       .getDelayPolynomials(0.0);
    DelayTable b = DelayPolynomial(reversed, targets, PsfSim::REFERENCE_ANTENNA)
                       .getDelayPolynomials(0.0);

    for (size_t t = 0; t < a.n_targets; t++) {
        EXPECT_EQ(a(t, 0).delay, b(t, 1).delay);
        EXPECT_EQ(a(t, 1).delay, b(t, 0).delay);
    }
}

TEST(DelayTest, MalformedOracleResponsesRaise) {
    std::vector<TargetInput> targets = {EquatorialCoordinate{10.0, -30.0}};

    DelayPolynomial missing_channels(triangleArray(), targets, PsfSim::REFERENCE_ANTENNA,
                                     1.4e9, DelaySelectionPolicy(),
                                     std::make_shared<FakeOracle>(3, 2));
    EXPECT_THROW(missing_channels.getDelayPolynomials(0.0), MosaicError);

    DelaySelectionPolicy late;
    late.sample_index = 1;
    DelayPolynomial missing_samples(triangleArray(), targets, PsfSim::REFERENCE_ANTENNA,
                                    1.4e9, late, std::make_shared<FakeOracle>(6, 1));
    EXPECT_THROW(missing_samples.getDelayPolynomials(0.0), MosaicError);
}

TEST(DelayTest, TilingDelaysAreRelativeToBoreSight) {
    EquatorialCoordinate bore = transitSource();
    auto shape = makeBeamShape(0.02, 0.01, 30.0, bore);
    Tiling tiling = generateNBeamsTiling(shape, 19, 0.5, EllipsePacker(2), 10);

    std::vector<TargetInput> targets = tiling.delayTargets();
    ASSERT_EQ(targets.size(), tiling.beamNum() + 1);
    EquatorialCoordinate first = resolveSource(targets[0]);
    EXPECT_NEAR(first.ra, bore.ra, 1e-9);
    EXPECT_NEAR(first.dec, bore.dec, 1e-9);

    DelayPolynomial poly(fourAntennas(), targets, PsfSim::REFERENCE_ANTENNA);
    DelayTable table = poly.getDelayPolynomials(0.0);
    ASSERT_EQ(table.n_targets, tiling.beamNum() + 1);

    // Beam 0 measured against the boresight, not against itself
    auto centres = tiling.equatorialCoordinates();
    DelayPolynomial pair(fourAntennas(), {bore, centres[0]}, PsfSim::REFERENCE_ANTENNA);
    DelayTable expected = pair.getDelayPolynomials(0.0);
    for (size_t a = 0; a < table.n_antennas; a++) {
        EXPECT_EQ(table(0, a).delay, 0.0);
        EXPECT_EQ(table(1, a).delay, expected(1, a).delay);
    }
}

TEST(DelayTest, RejectsInvalidArguments) {
    std::vector<TargetInput> targets = {EquatorialCoordinate{10.0, -30.0}};

    EXPECT_THROW(DelayPolynomial({}, targets, PsfSim::REFERENCE_ANTENNA), std::invalid_argument);
    EXPECT_THROW(DelayPolynomial(triangleArray(), {}, PsfSim::REFERENCE_ANTENNA),
                 std::invalid_argument);

    DelaySelectionPolicy bad;
    bad.polarization_index = 2;
    EXPECT_THROW(DelayPolynomial(triangleArray(), targets, PsfSim::REFERENCE_ANTENNA, 1.4e9, bad),
                 std::invalid_argument);

    DelayPolynomial poly(triangleArray(), targets, PsfSim::REFERENCE_ANTENNA);
    EXPECT_THROW(poly.getDelayPolynomials(0.0, 0.0), std::invalid_argument);
    EXPECT_THROW(poly.getDelayPolynomials(0.0, -5.0), std::invalid_argument);
}

TEST(DelayTest, WritesDelayTable) {
    DelayPolynomial poly(triangleArray(), offsetTargets(transitSource()),
                         PsfSim::REFERENCE_ANTENNA);
    DelayTable table = poly.getDelayPolynomials(DateTime{2022, 5, 17, 3, 0, 0.0});

    const std::string path = "mosaic_test_delays.txt";
    ASSERT_TRUE(writeDelayTable(path, table, poly.targets()));

    std::ifstream file(path);
    std::string line;
    std::vector<std::string> rows;
    while (std::getline(file, line)) {
        if (!line.empty() && line[0] != '#') rows.push_back(line);
    }
    ASSERT_EQ(rows.size(), table.n_targets * table.n_antennas);
    EXPECT_EQ(rows.front().rfind("ref 0 ", 0), 0u);
    EXPECT_EQ(rows[table.n_antennas].rfind("0 0 ", 0), 0u);
    EXPECT_EQ(rows.back().rfind(std::to_string(table.n_targets - 2) + " ", 0), 0u);
    std::filesystem::remove(path);
}

} // namespace mosaic::test
