/**
 * @file delay.hpp
 * @brief Per-beam, per-antenna steering delays relative to the boresight beam
 */

#ifndef MOSAIC_DELAY_HPP
#define MOSAIC_DELAY_HPP

#include "mosaic/ephemeris.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mosaic {

struct DelaySample {
    double delay;   // seconds
    double rate;    // seconds per second
    double phase;   // radians at the correction frequency
};

/**
 * @brief Corrections for every input channel over a time window
 *
 * Channels are antenna-major with the polarizations innermost:
 * channel = antenna * polarizations + polarization.
 */
struct DelayCorrections {
    std::vector<std::string> channel_ids;
    std::vector<std::vector<DelaySample>> samples;   // [channel][timestamp]
};

/**
 * @brief Source of geometric delay corrections for one pointing
 */
class DelayOracle {
public:
    virtual ~DelayOracle() = default;

    /**
     * @brief Corrections at both ends of window (epoch seconds)
     */
    virtual DelayCorrections corrections(const Target& target,
                                         std::pair<double, double> window) const = 0;
};

/**
 * @brief Plane-wave delays from ECEF baselines to a reference antenna
 */
class GeometricDelayCorrection : public DelayOracle {
public:
    GeometricDelayCorrection(AntennaGeometry antennas,
                             const GeoCoordinate& reference,
                             double frequency,
                             int polarizations = 2);

    DelayCorrections corrections(const Target& target,
                                 std::pair<double, double> window) const override;

private:
    AntennaGeometry antennas_;
    std::vector<Ecef> baselines_;   // antenna minus reference, meters
    double frequency_;
    int polarizations_;
};

/**
 * @brief Which channel and timestamp of an oracle response feed the table
 */
struct DelaySelectionPolicy {
    int polarizations = 2;        // channels per antenna in the response
    int polarization_index = 0;   // channel kept for each antenna
    int sample_index = 0;         // timestamp kept from the window
};

struct DelayTerms {
    double delay;
    double rate;
};

/**
 * @brief Delay terms indexed [target][antenna]
 */
struct DelayTable {
    size_t n_targets = 0;
    size_t n_antennas = 0;
    std::vector<DelayTerms> values;

    DelayTerms& operator()(size_t target, size_t antenna) {
        return values[target * n_antennas + antenna];
    }
    const DelayTerms& operator()(size_t target, size_t antenna) const {
        return values[target * n_antennas + antenna];
    }
};

class DelayPolynomial {
public:
    /**
     * @param oracle Correction source; null builds a GeometricDelayCorrection
     *        over the resolved antennas
     */
    DelayPolynomial(const std::vector<AntennaInput>& antennas,
                    const std::vector<TargetInput>& targets,
                    const AntennaInput& reference,
                    double frequency = 1.4e9,
                    const DelaySelectionPolicy& policy = DelaySelectionPolicy(),
                    std::shared_ptr<const DelayOracle> oracle = nullptr);

    /**
     * @brief Delay and rate of every (target, antenna) over [epoch, epoch + duration]
     *
     * The first target is the reference beam: its row is subtracted from every
     * row, so row 0 is zero.
     */
    DelayTable getDelayPolynomials(const TimeInput& epoch, double duration = 10.0) const;

    const AntennaGeometry& antennas() const { return antennas_; }
    const std::vector<Target>& targets() const { return targets_; }
    const GeoCoordinate& reference() const { return reference_; }
    double frequency() const { return frequency_; }

private:
    AntennaGeometry antennas_;
    std::vector<Target> targets_;
    GeoCoordinate reference_;
    double frequency_;
    DelaySelectionPolicy policy_;
    std::shared_ptr<const DelayOracle> oracle_;
};

bool writeDelayTable(const std::string& filename, const DelayTable& table,
                     const std::vector<Target>& targets);

} // namespace mosaic

#endif // MOSAIC_DELAY_HPP
