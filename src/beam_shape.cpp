#include "mosaic/beam_shape.hpp"
#include "mosaic/errors.hpp"
#include "mosaic/utils.hpp"

#include <cmath>
#include <stdexcept>

namespace mosaic {

void checkOverlap(double overlap) {
    // Also rejects NaN
    if (!(overlap > 0.0 && overlap < 1.0)) {
        throw InvalidOverlapError("Overlap must lie in the open interval (0, 1), got "
                                  + std::to_string(overlap));
    }
}

BeamShape::BeamShape(double axisH, double axisV, double angle,
                     std::shared_ptr<const PointSpreadFunction> psf,
                     AntennaGeometry antennas,
                     const EquatorialCoordinate& bore_sight,
                     const GeoCoordinate& reference_antenna,
                     const HorizontalCoordinate& horizon)
    : axisH_(axisH), axisV_(axisV), angle_(angle),
      psf_(std::move(psf)), antennas_(std::move(antennas)),
      bore_sight_(bore_sight), reference_antenna_(reference_antenna),
      horizon_(horizon)
{
    if (!(axisV_ >= 0.0) || !(axisH_ >= axisV_) || !std::isfinite(axisH_)) {
        throw std::invalid_argument("Beam axes must satisfy axisH >= axisV >= 0");
    }
    if (!std::isfinite(angle_)) {
        throw std::invalid_argument("Beam angle must be finite");
    }
}

double BeamShape::sigmaH() const {
    return axisH_ * (2.0 / FWHM_TO_SIGMA);
}

double BeamShape::sigmaV() const {
    return axisV_ * (2.0 / FWHM_TO_SIGMA);
}

std::pair<double, double> BeamShape::widthAtOverlap(double overlap) const {
    checkOverlap(overlap);
    if (axisV_ <= 0.0) {
        throw MosaicError("Degenerate beam shape (axisV = 0) has no width at overlap");
    }

    double widthH = normInverse(overlap, 0.0, sigmaH());
    double widthV = normInverse(overlap, 0.0, sigmaV());

    return {widthH, widthV};
}

} // namespace mosaic
