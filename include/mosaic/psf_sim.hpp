/**
 * @file psf_sim.hpp
 * @brief Beam shape simulation for an antenna array
 */

#ifndef MOSAIC_PSF_SIM_HPP
#define MOSAIC_PSF_SIM_HPP

#include "mosaic/beam_shape.hpp"
#include "mosaic/ephemeris.hpp"
#include "mosaic/observation.hpp"

#include <memory>
#include <vector>

namespace mosaic {

/**
 * @brief Drives an observation engine to derive the BeamShape
 *
 * Each PsfSim owns its engine; the boresight/time/contour sequence in
 * getBeamShape() must not be interleaved with other users of that engine.
 */
class PsfSim {
public:
    // Array reference point, lat (deg), lon (deg), altitude (m)
    static const GeoCoordinate REFERENCE_ANTENNA;

    /**
     * @param antennas Array antennas, literal or ephemeris handles
     * @param frequencies Observing frequencies in Hz
     */
    PsfSim(const std::vector<AntennaInput>& antennas,
           const std::vector<double>& frequencies,
           const GeoCoordinate& reference = REFERENCE_ANTENNA,
           const PsfOptions& options = PsfOptions());

    /**
     * @brief Use a caller-supplied engine instead of InterferometryObservation
     */
    PsfSim(const std::vector<AntennaInput>& antennas,
           const std::vector<double>& frequencies,
           std::unique_ptr<ObservationEngine> engine,
           const GeoCoordinate& reference = REFERENCE_ANTENNA);

    /**
     * @brief Beam shape for a boresight at a given time
     * @throws InsufficientAntennasError with fewer than 3 antennas
     */
    std::shared_ptr<const BeamShape> getBeamShape(const TargetInput& source,
                                                  const TimeInput& time);

    const AntennaGeometry& antennas() const { return antennas_; }
    const std::vector<double>& wavelengths() const { return wavelengths_; }
    const GeoCoordinate& reference() const { return reference_; }

    /**
     * @brief Half width (deg) of a dish primary beam at the longest wavelength
     */
    double primaryBeamRadius(double dish_diameter = 13.5) const;

    static AntennaGeometry checkAntennas(const std::vector<AntennaInput>& antennas);
    static EquatorialCoordinate checkSource(const TargetInput& source);

private:
    GeoCoordinate reference_;
    std::vector<double> wavelengths_;
    AntennaGeometry antennas_;
    std::unique_ptr<ObservationEngine> observation_;

    static std::vector<double> toWavelengths(const std::vector<double>& frequencies);
};

} // namespace mosaic

#endif // MOSAIC_PSF_SIM_HPP
