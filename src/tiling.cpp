#include "mosaic/tiling.hpp"
#include "mosaic/ephemeris.hpp"
#include "mosaic/errors.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace mosaic {

Tiling::Tiling(std::vector<Offset> coordinates,
               std::shared_ptr<const BeamShape> beam_shape,
               double radius, double overlap)
    : coordinates_(std::move(coordinates)),
      beam_shape_(std::move(beam_shape)),
      tiling_radius_(radius),
      overlap_(overlap)
{
    checkOverlap(overlap_);
    if (!beam_shape_) {
        throw std::invalid_argument("Tiling needs a beam shape");
    }
    if (!(tiling_radius_ >= 0.0) || !std::isfinite(tiling_radius_)) {
        throw std::invalid_argument("Tiling radius must be a finite non-negative number");
    }
}

std::pair<double, double> Tiling::widths() const {
    return beam_shape_->widthAtOverlap(overlap_);
}

Overlap Tiling::calculateOverlap(OverlapMode mode,
                                 const std::shared_ptr<const BeamShape>& new_beam_shape,
                                 const OverlapOptions& options) const {
    const BeamShape& beam_shape = new_beam_shape ? *new_beam_shape : *beam_shape_;
    if (beam_shape.axisV() <= 0.0) {
        throw MosaicError("Degenerate beam shape (axisV = 0) has no footprint");
    }

    return calculateBeamOverlaps(coordinates_, tiling_radius_,
                                 beam_shape.axisH(), beam_shape.axisV(), beam_shape.angle(),
                                 overlap_, mode, options);
}

Overlap Tiling::skyPattern(const OverlapOptions& options) const {
    return calculateOverlap(OverlapMode::HEATER, nullptr, options);
}

std::vector<EquatorialCoordinate> Tiling::equatorialCoordinates() const {
    std::vector<EquatorialCoordinate> equatorial;
    equatorial.reserve(coordinates_.size());
    for (const auto& offset : coordinates_) {
        equatorial.push_back(offsetToEquatorial(offset, beam_shape_->boreSight()));
    }
    return equatorial;
}

std::vector<TargetInput> Tiling::delayTargets() const {
    std::vector<TargetInput> targets;
    targets.reserve(coordinates_.size() + 1);
    Target bore_sight = Target::fromEquatorial(beam_shape_->boreSight());
    bore_sight.name = "boresight";
    targets.push_back(bore_sight);
    for (const auto& centre : equatorialCoordinates()) {
        targets.push_back(centre);
    }
    return targets;
}

Tiling generateNBeamsTiling(const std::shared_ptr<const BeamShape>& beam_shape,
                            int beam_num, double overlap,
                            const PackingEngine& packer, int precision) {
    if (!beam_shape) {
        throw std::invalid_argument("Tiling needs a beam shape");
    }
    auto [widthH, widthV] = beam_shape->widthAtOverlap(overlap);

    PackingResult packed = packer.compact(beam_num, widthH, widthV,
                                          beam_shape->angle(), precision);

    Tiling tiling(std::move(packed.coordinates), beam_shape, packed.radius, overlap);
    std::cout << "Tiling: " << tiling.beamNum() << " beams, radius "
              << tiling.tilingRadius() << " deg" << std::endl;
    return tiling;
}

Tiling generateNBeamsTiling(const std::shared_ptr<const BeamShape>& beam_shape,
                            int beam_num, double overlap, int precision) {
    return generateNBeamsTiling(beam_shape, beam_num, overlap, EllipsePacker(), precision);
}

Tiling generateRadiusTiling(const std::shared_ptr<const BeamShape>& beam_shape,
                            double tiling_radius, double overlap,
                            const PackingEngine& packer) {
    if (!beam_shape) {
        throw std::invalid_argument("Tiling needs a beam shape");
    }
    auto [widthH, widthV] = beam_shape->widthAtOverlap(overlap);

    std::vector<Offset> coordinates = packer.grid(tiling_radius, widthH, widthV,
                                                  beam_shape->angle());

    Tiling tiling(std::move(coordinates), beam_shape, tiling_radius, overlap);
    std::cout << "Tiling: " << tiling.beamNum() << " beams inside "
              << tiling.tilingRadius() << " deg" << std::endl;
    return tiling;
}

Tiling generateRadiusTiling(const std::shared_ptr<const BeamShape>& beam_shape,
                            double tiling_radius, double overlap) {
    return generateRadiusTiling(beam_shape, tiling_radius, overlap, EllipsePacker());
}

bool writeTilingFile(const std::string& filename, const Tiling& tiling) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Cannot open tiling file: " << filename << std::endl;
        return false;
    }

    auto [widthH, widthV] = tiling.widths();
    const BeamShape& shape = *tiling.beamShape();
    file << "# boresight " << angleToHour(shape.boreSight().ra) << " "
         << angleToDec(shape.boreSight().dec) << "\n";
    file << "# beams " << tiling.beamNum() << " radius " << tiling.tilingRadius()
         << " overlap " << tiling.overlap() << "\n";
    file << "# widths " << widthH << " " << widthV << " angle " << shape.angle() << "\n";
    file << "# beam x(deg) y(deg) ra dec\n";

    auto equatorial = tiling.equatorialCoordinates();
    file << std::fixed << std::setprecision(8);
    for (size_t i = 0; i < tiling.beamNum(); i++) {
        const Offset& c = tiling.coordinates()[i];
        file << i << " " << c.x << " " << c.y << " "
             << angleToHour(equatorial[i].ra) << " " << angleToDec(equatorial[i].dec) << "\n";
    }

    if (!file) {
        std::cerr << "Error writing tiling file: " << filename << std::endl;
        return false;
    }
    std::cout << "Wrote " << filename << std::endl;
    return true;
}

} // namespace mosaic
