#include "mosaic/psf_sim.hpp"
#include "mosaic/errors.hpp"
#include "mosaic/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace mosaic {

const GeoCoordinate PsfSim::REFERENCE_ANTENNA = {-30.71106, 21.44389, 1035.0};

PsfSim::PsfSim(const std::vector<AntennaInput>& antennas,
               const std::vector<double>& frequencies,
               const GeoCoordinate& reference,
               const PsfOptions& options)
    : reference_(reference),
      wavelengths_(toWavelengths(frequencies)),
      antennas_(checkAntennas(antennas))
{
    observation_ = std::make_unique<InterferometryObservation>(reference_, wavelengths_, options);
}

PsfSim::PsfSim(const std::vector<AntennaInput>& antennas,
               const std::vector<double>& frequencies,
               std::unique_ptr<ObservationEngine> engine,
               const GeoCoordinate& reference)
    : reference_(reference),
      wavelengths_(toWavelengths(frequencies)),
      antennas_(checkAntennas(antennas)),
      observation_(std::move(engine))
{
    if (!observation_) {
        throw std::invalid_argument("Observation engine must not be null");
    }
}

std::vector<double> PsfSim::toWavelengths(const std::vector<double>& frequencies) {
    if (frequencies.empty()) {
        throw std::invalid_argument("At least one frequency is required");
    }
    std::vector<double> wavelengths;
    wavelengths.reserve(frequencies.size());
    for (double f : frequencies) {
        if (!(f > 0.0) || !std::isfinite(f)) {
            throw std::invalid_argument("Frequencies must be positive");
        }
        wavelengths.push_back(C_LIGHT / f);
    }
    return wavelengths;
}

AntennaGeometry PsfSim::checkAntennas(const std::vector<AntennaInput>& antennas) {
    return resolveAntennas(antennas);
}

EquatorialCoordinate PsfSim::checkSource(const TargetInput& source) {
    return resolveSource(source);
}

std::shared_ptr<const BeamShape> PsfSim::getBeamShape(const TargetInput& source,
                                                      const TimeInput& time) {
    if (antennas_.size() < 3) {
        throw InsufficientAntennasError("The number of antennas should not be less than 3, got "
                                        + std::to_string(antennas_.size()));
    }

    EquatorialCoordinate bore_sight = checkSource(source);
    double epoch = resolveEpoch(time);

    observation_->setBoreSight(bore_sight);
    observation_->setObserveTime(epoch);
    observation_->createContour(antennas_);

    BeamAxis axis = observation_->getBeamAxis();
    auto [az, el] = observation_->getHorizontal();
    HorizontalCoordinate horizon = {rad2deg(az), rad2deg(el)};
    auto psf = observation_->getPointSpreadFunction();

    return std::make_shared<BeamShape>(axis.axisH, axis.axisV, axis.angle, psf,
                                        antennas_, bore_sight, reference_, horizon);
}

double PsfSim::primaryBeamRadius(double dish_diameter) const {
    if (!(dish_diameter > 0.0)) {
        throw std::invalid_argument("Dish diameter must be positive");
    }
    double lambda = *std::max_element(wavelengths_.begin(), wavelengths_.end());
    return rad2deg(1.22 * lambda / dish_diameter) / 2.0;
}

} // namespace mosaic
