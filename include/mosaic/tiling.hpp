/**
 * @file tiling.hpp
 * @brief Multi-beam tiling patterns derived from a BeamShape
 */

#ifndef MOSAIC_TILING_HPP
#define MOSAIC_TILING_HPP

#include "mosaic/beam_shape.hpp"
#include "mosaic/ephemeris.hpp"
#include "mosaic/overlap.hpp"
#include "mosaic/packing.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mosaic {

/**
 * @brief Ordered beam centres covering a sky region
 *
 * The position of a centre in coordinates() is its beam index; delay
 * assignment and every other consumer keep that order.
 */
class Tiling {
public:
    Tiling(std::vector<Offset> coordinates,
           std::shared_ptr<const BeamShape> beam_shape,
           double radius, double overlap);

    const std::vector<Offset>& coordinates() const { return coordinates_; }
    const std::shared_ptr<const BeamShape>& beamShape() const { return beam_shape_; }
    double tilingRadius() const { return tiling_radius_; }
    double overlap() const { return overlap_; }
    size_t beamNum() const { return coordinates_.size(); }

    // Half widths of one beam at this tiling's overlap level
    std::pair<double, double> widths() const;

    /**
     * @brief Coverage of this tiling on a sample grid
     *
     * @param new_beam_shape Footprint to evaluate instead of the tiling's own
     *        beam shape (e.g. the beam at a later time); null uses beamShape()
     */
    Overlap calculateOverlap(OverlapMode mode,
                             const std::shared_ptr<const BeamShape>& new_beam_shape = nullptr,
                             const OverlapOptions& options = OverlapOptions()) const;

    // Summed response of all beams
    Overlap skyPattern(const OverlapOptions& options = OverlapOptions()) const;

    // Beam centres as RA/Dec around the beam shape's boresight
    std::vector<EquatorialCoordinate> equatorialCoordinates() const;

    /**
     * @brief Delay targets: the boresight, then every beam centre in order
     *
     * The packed beams need not include the pointing centre, so the boresight
     * is always the reference row and beam i sits at row i + 1.
     */
    std::vector<TargetInput> delayTargets() const;

private:
    std::vector<Offset> coordinates_;
    std::shared_ptr<const BeamShape> beam_shape_;
    double tiling_radius_;
    double overlap_;
};

/**
 * @brief Tiling of a fixed number of beams packed as tightly as possible
 */
Tiling generateNBeamsTiling(const std::shared_ptr<const BeamShape>& beam_shape,
                            int beam_num, double overlap,
                            const PackingEngine& packer, int precision = 10);

// Packs with a default EllipsePacker
Tiling generateNBeamsTiling(const std::shared_ptr<const BeamShape>& beam_shape,
                            int beam_num, double overlap = 0.5, int precision = 10);

/**
 * @brief Tiling of every grid beam that fits inside a radius (degrees)
 */
Tiling generateRadiusTiling(const std::shared_ptr<const BeamShape>& beam_shape,
                            double tiling_radius, double overlap,
                            const PackingEngine& packer);

Tiling generateRadiusTiling(const std::shared_ptr<const BeamShape>& beam_shape,
                            double tiling_radius, double overlap = 0.5);

/**
 * @brief Write beam index, offsets and RA/Dec of every beam, one per line
 */
bool writeTilingFile(const std::string& filename, const Tiling& tiling);

} // namespace mosaic

#endif // MOSAIC_TILING_HPP
