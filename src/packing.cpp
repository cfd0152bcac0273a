#include "mosaic/packing.hpp"
#include "mosaic/errors.hpp"
#include "mosaic/utils.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <omp.h>
#include <stdexcept>
#include <utility>

namespace mosaic {

namespace {

const double SQRT3 = std::sqrt(3.0);

// Distance quantised to 1e-9 deg so equal rings compare equal
std::pair<long long, double> canonicalKey(const Offset& p) {
    double d = std::hypot(p.x, p.y);
    double pa = std::atan2(p.y, p.x);
    if (pa < 0) pa += 2.0 * PI;
    return {std::llround(d * 1e9), pa};
}

} // namespace

EllipsePacker::EllipsePacker(int num_threads)
    : num_threads_(std::max(1, num_threads))
{
}

Offset EllipsePacker::Lattice::point(long i, long j) const {
    // Unit-circle hexagonal lattice: a1 = (2, 0), a2 = (1, sqrt 3)
    double ci = i + origin_i;
    double cj = j + origin_j;
    double px = (2.0 * ci + cj) * widthH;
    double py = (SQRT3 * cj) * widthV;

    double theta = deg2rad(angle);
    double c = std::cos(theta);
    double s = std::sin(theta);
    return Offset{px * c - py * s, px * s + py * c};
}

std::vector<Offset> EllipsePacker::latticeWithin(const Lattice& lattice, double radius) {
    // |sky| >= widthV * |unit-circle|, so this index box covers the disk
    long k = static_cast<long>(std::ceil(radius / lattice.widthV)) + 2;
    if (k > MAX_LATTICE_HALF_EXTENT) {
        throw MosaicError("Tiling radius is too large for the beam width");
    }

    std::vector<Offset> points;
    for (long j = -k; j <= k; j++) {
        for (long i = -k; i <= k; i++) {
            Offset p = lattice.point(i, j);
            if (std::hypot(p.x, p.y) <= radius) {
                points.push_back(p);
            }
        }
    }
    return points;
}

void EllipsePacker::sortCanonical(std::vector<Offset>& points) {
    std::sort(points.begin(), points.end(), [](const Offset& a, const Offset& b) {
        return canonicalKey(a) < canonicalKey(b);
    });
}

void EllipsePacker::checkWidths(double widthH, double widthV) {
    if (!(widthH > 0.0) || !(widthV > 0.0) || !std::isfinite(widthH) || !std::isfinite(widthV)) {
        throw std::invalid_argument("Beam widths must be positive and finite");
    }
}

double EllipsePacker::circumscribingRadius(const std::vector<Offset>& centres,
                                           double widthH, double widthV, double angle) {
    double theta = deg2rad(angle);
    double c = std::cos(theta);
    double s = std::sin(theta);

    std::vector<Offset> outline(OUTLINE_SAMPLES);
    for (int k = 0; k < OUTLINE_SAMPLES; k++) {
        double t = 2.0 * PI * k / OUTLINE_SAMPLES;
        double ex = widthH * std::cos(t);
        double ey = widthV * std::sin(t);
        outline[k] = Offset{ex * c - ey * s, ex * s + ey * c};
    }

    double radius = 0.0;
    for (const auto& centre : centres) {
        for (const auto& e : outline) {
            radius = std::max(radius, std::hypot(centre.x + e.x, centre.y + e.y));
        }
    }
    return radius;
}

std::vector<Offset> EllipsePacker::grid(double radius, double widthH, double widthV,
                                        double angle) const {
    checkWidths(widthH, widthV);
    if (!(radius >= 0.0) || !std::isfinite(radius)) {
        throw std::invalid_argument("Tiling radius must be a finite non-negative number");
    }

    // widthH is not necessarily the larger one for a caller-supplied shape
    Lattice lattice = {widthH, widthV, angle, 0.0, 0.0};
    if (widthV > widthH) {
        lattice = {widthV, widthH, angle + 90.0, 0.0, 0.0};
    }

    auto points = latticeWithin(lattice, radius);
    sortCanonical(points);

    std::cout << "Grid tiling: " << points.size() << " beams inside "
              << radius << " deg" << std::endl;
    return points;
}

PackingResult EllipsePacker::compact(int beam_count, double widthH, double widthV,
                                     double angle, int precision) const {
    checkWidths(widthH, widthV);
    if (beam_count < 1) {
        throw std::invalid_argument("Beam count must be at least 1");
    }
    if (precision < 1) {
        throw std::invalid_argument("Packing precision must be at least 1");
    }

    double major = std::max(widthH, widthV);
    double minor = std::min(widthH, widthV);
    double major_angle = (widthH >= widthV) ? angle : angle + 90.0;

    // Disk expected to hold beam_count lattice points, plus one cell of margin
    double cell_area = 2.0 * SQRT3 * major * minor;
    double search_radius = std::sqrt(beam_count * cell_area / PI) + 4.0 * major;

    int n_candidates = precision * precision;
    std::vector<PackingResult> candidates(n_candidates);

    std::cout << "=== Compact Packing ===" << std::endl;
    std::cout << "Beams: " << beam_count << ", candidates: " << n_candidates << std::endl;

    std::exception_ptr failure;

    #pragma omp parallel for num_threads(num_threads_) schedule(dynamic)
    for (int idx = 0; idx < n_candidates; idx++) {
        try {
            Lattice lattice = {major, minor, major_angle,
                               static_cast<double>(idx % precision) / precision,
                               static_cast<double>(idx / precision) / precision};

            double r = search_radius;
            std::vector<Offset> points = latticeWithin(lattice, r);
            while (points.size() < static_cast<size_t>(beam_count)) {
                r *= 2.0;
                points = latticeWithin(lattice, r);
            }

            sortCanonical(points);
            points.resize(beam_count);

            candidates[idx].radius = circumscribingRadius(points, major, minor, major_angle);
            candidates[idx].coordinates = std::move(points);
        } catch (...) {
            // Exceptions must not leave the parallel region
            #pragma omp critical(mosaic_packing_failure)
            if (!failure) failure = std::current_exception();
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }

    // Serial reduction keeps the choice independent of thread scheduling
    size_t best = 0;
    for (size_t idx = 1; idx < candidates.size(); idx++) {
        if (candidates[idx].radius < candidates[best].radius) {
            best = idx;
        }
    }

    std::cout << "Tiling radius: " << candidates[best].radius << " deg" << std::endl;
    std::cout << "=== Packing Complete ===" << std::endl;

    return std::move(candidates[best]);
}

} // namespace mosaic
