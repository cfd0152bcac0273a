/**
 * @file beam_shape.hpp
 * @brief Elliptical approximation of the synthesized main lobe
 */

#ifndef MOSAIC_BEAM_SHAPE_HPP
#define MOSAIC_BEAM_SHAPE_HPP

#include "mosaic/coordinates.hpp"
#include "mosaic/observation.hpp"

#include <memory>
#include <utility>

namespace mosaic {

/**
 * @brief Immutable beam shape of one (array, target, time) triple
 *
 * axisH and axisV are the semi-axes of the half-maximum contour in degrees,
 * so the full width at half maximum along each axis is twice the semi-axis.
 */
class BeamShape {
public:
    BeamShape(double axisH, double axisV, double angle,
              std::shared_ptr<const PointSpreadFunction> psf,
              AntennaGeometry antennas,
              const EquatorialCoordinate& bore_sight,
              const GeoCoordinate& reference_antenna,
              const HorizontalCoordinate& horizon);

    double axisH() const { return axisH_; }
    double axisV() const { return axisV_; }
    double angle() const { return angle_; }

    const std::shared_ptr<const PointSpreadFunction>& psf() const { return psf_; }
    const AntennaGeometry& antennas() const { return antennas_; }
    const EquatorialCoordinate& boreSight() const { return bore_sight_; }
    const GeoCoordinate& referenceAntenna() const { return reference_antenna_; }
    const HorizontalCoordinate& horizon() const { return horizon_; }

    /**
     * @brief Half widths (degrees) along both axes at a given overlap level
     *
     * Two beams spaced twice these widths apart each respond with exactly
     * `overlap` of their peak at the midpoint.
     *
     * @param overlap Fraction of peak in the open interval (0, 1)
     * @return (widthH, widthV)
     * @throws InvalidOverlapError when overlap is outside (0, 1)
     * @throws MosaicError when axisV is 0 (a line beam has no tiling width)
     */
    std::pair<double, double> widthAtOverlap(double overlap) const;

    // Gaussian sigmas (degrees) of the two axes
    double sigmaH() const;
    double sigmaV() const;

private:
    double axisH_;
    double axisV_;
    double angle_;
    std::shared_ptr<const PointSpreadFunction> psf_;
    AntennaGeometry antennas_;
    EquatorialCoordinate bore_sight_;
    GeoCoordinate reference_antenna_;
    HorizontalCoordinate horizon_;
};

void checkOverlap(double overlap);

} // namespace mosaic

#endif // MOSAIC_BEAM_SHAPE_HPP
