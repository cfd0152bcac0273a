#include "mosaic/overlap.hpp"
#include "mosaic/beam_shape.hpp"
#include "mosaic/errors.hpp"
#include "mosaic/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <omp.h>
#include <stdexcept>

namespace mosaic {

std::string toString(OverlapMode mode) {
    switch (mode) {
        case OverlapMode::COUNTER:
            return "counter";
        case OverlapMode::HEATER:
            return "heater";
    }
    return "unknown";
}

OverlapMode overlapModeFromString(const std::string& name) {
    if (name == "counter") return OverlapMode::COUNTER;
    if (name == "heater") return OverlapMode::HEATER;
    throw InvalidInputTypeError("Unknown overlap mode '" + name + "'");
}

Overlap::Overlap(OverlapGrid metrics, OverlapMode mode)
    : metrics_(std::move(metrics)), mode_(mode)
{
    if (metrics_.values.size() != static_cast<size_t>(metrics_.nx) * metrics_.ny) {
        throw std::invalid_argument("Overlap grid size does not match its dimensions");
    }
}

OverlapFractions Overlap::calculateFractions() const {
    if (mode_ != OverlapMode::COUNTER) {
        throw UnsupportedModeError("The fraction calculation is only supported in counter mode, not "
                                   + toString(mode_));
    }

    size_t overlap_grid = 0;
    size_t non_overlap_grid = 0;
    size_t empty_grid = 0;
    for (double count : metrics_.values) {
        if (count > 1) overlap_grid++;
        else if (count == 1) non_overlap_grid++;
        else empty_grid++;
    }

    size_t point_num = overlap_grid + non_overlap_grid + empty_grid;
    if (point_num == 0) {
        throw MosaicError("Overlap grid has no samples");
    }

    OverlapFractions fractions;
    fractions.overlapped = static_cast<double>(overlap_grid) / point_num;
    fractions.non_overlapped = static_cast<double>(non_overlap_grid) / point_num;
    fractions.empty = static_cast<double>(empty_grid) / point_num;
    return fractions;
}

Overlap calculateBeamOverlaps(const std::vector<Offset>& coordinates,
                              double radius,
                              double axisH, double axisV, double angle,
                              double overlap, OverlapMode mode,
                              const OverlapOptions& options) {
    checkOverlap(overlap);
    if (!(axisH > 0.0) || !(axisV > 0.0)) {
        throw std::invalid_argument("Beam axes must be positive for the overlap calculation");
    }
    if (options.grid_size < 1) {
        throw std::invalid_argument("Overlap grid size must be at least 1");
    }

    double threshold = options.counter_threshold.value_or(overlap);
    if (!(threshold > 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument("Counter threshold must lie in (0, 1]");
    }

    double sigma_h = axisH * (2.0 / FWHM_TO_SIGMA);
    double sigma_v = axisV * (2.0 / FWHM_TO_SIGMA);

    OverlapGrid grid;
    grid.nx = options.grid_size;
    grid.ny = options.grid_size;
    grid.extent = radius;
    if (!(grid.extent > 0.0)) {
        for (const auto& c : coordinates) {
            grid.extent = std::max(grid.extent, std::hypot(c.x, c.y));
        }
        grid.extent += axisH;
    }
    grid.values.assign(static_cast<size_t>(grid.nx) * grid.ny, 0.0);

    std::cout << "=== Calculating Overlap (" << toString(mode) << ") ===" << std::endl;
    std::cout << "Beams: " << coordinates.size() << ", grid: "
              << grid.nx << " x " << grid.ny << ", extent: " << grid.extent << " deg" << std::endl;

    const bool counter = (mode == OverlapMode::COUNTER);

    // Each sample sums its beams in tile order, independent of the thread split
    #pragma omp parallel for num_threads(options.num_threads) schedule(static)
    for (int iy = 0; iy < grid.ny; iy++) {
        double y = grid.position(iy);
        for (int ix = 0; ix < grid.nx; ix++) {
            double x = grid.position(ix);
            double total = 0.0;
            for (const auto& c : coordinates) {
                double response = ellipticalGaussian(x - c.x, y - c.y, sigma_h, sigma_v, angle);
                if (counter) {
                    if (response >= threshold) total += 1.0;
                } else {
                    total += response;
                }
            }
            grid.values[static_cast<size_t>(iy) * grid.nx + ix] = total;
        }
    }

    std::cout << "=== Overlap Complete ===" << std::endl;

    return Overlap(std::move(grid), mode);
}

} // namespace mosaic
