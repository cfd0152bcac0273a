/**
 * @file overlap.hpp
 * @brief Coverage of a tiling sampled on a regular grid
 */

#ifndef MOSAIC_OVERLAP_HPP
#define MOSAIC_OVERLAP_HPP

#include "mosaic/coordinates.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mosaic {

enum class OverlapMode {
    COUNTER,   // number of beams covering each sample
    HEATER     // summed Gaussian response at each sample
};

std::string toString(OverlapMode mode);
OverlapMode overlapModeFromString(const std::string& name);

struct OverlapOptions {
    int grid_size = 400;                      // samples per side
    std::optional<double> counter_threshold;  // unset: the tiling overlap
    int num_threads = 4;
};

/**
 * @brief Square sample grid over [-extent, extent] on both axes, degrees
 */
struct OverlapGrid {
    int nx = 0;
    int ny = 0;
    double extent = 0.0;
    std::vector<double> values;   // row-major [y][x]

    double at(int x, int y) const { return values[static_cast<size_t>(y) * nx + x]; }
    double step() const { return nx > 1 ? 2.0 * extent / (nx - 1) : 0.0; }

    // Offset (degrees) of sample index i along either axis
    double position(int i) const { return nx > 1 ? -extent + i * step() : 0.0; }
};

struct OverlapFractions {
    double overlapped;       // covered by more than one beam
    double non_overlapped;   // covered by exactly one beam
    double empty;            // not covered
};

class Overlap {
public:
    Overlap(OverlapGrid metrics, OverlapMode mode);

    const OverlapGrid& metrics() const { return metrics_; }
    OverlapMode mode() const { return mode_; }

    /**
     * @brief Fractions of samples that are overlapped, single-covered, empty
     * @throws UnsupportedModeError unless the mode is COUNTER
     */
    OverlapFractions calculateFractions() const;

private:
    OverlapGrid metrics_;
    OverlapMode mode_;
};

/**
 * @brief Sample the footprints of all beams of a tiling
 *
 * Beam footprints are elliptical Gaussians with half-maximum semi-axes
 * axisH/axisV (degrees) oriented at angle. In COUNTER mode a sample counts as
 * covered by a beam where the response is at least the counter threshold,
 * which defaults to the overlap fraction of the tiling.
 */
Overlap calculateBeamOverlaps(const std::vector<Offset>& coordinates,
                              double radius,
                              double axisH, double axisV, double angle,
                              double overlap, OverlapMode mode,
                              const OverlapOptions& options = OverlapOptions());

} // namespace mosaic

#endif // MOSAIC_OVERLAP_HPP
