/**
 * @file packing.hpp
 * @brief Placement of elliptical beams on the tangent plane
 */

#ifndef MOSAIC_PACKING_HPP
#define MOSAIC_PACKING_HPP

#include "mosaic/coordinates.hpp"

#include <vector>

namespace mosaic {

struct PackingResult {
    std::vector<Offset> coordinates;   // degrees from the boresight
    double radius = 0.0;               // circumscribing radius, degrees
};

/**
 * @brief Interface of the engine that searches beam placements
 *
 * Widths are the half widths of one beam at the requested overlap level,
 * angle the orientation of widthH in degrees.
 */
class PackingEngine {
public:
    virtual ~PackingEngine() = default;

    /**
     * @brief Most compact arrangement of exactly beam_count ellipses
     * @param precision Search resolution, higher is slower and tighter
     */
    virtual PackingResult compact(int beam_count, double widthH, double widthV,
                                  double angle, int precision) const = 0;

    /**
     * @brief All centres of a regular elliptical grid inside radius
     */
    virtual std::vector<Offset> grid(double radius, double widthH, double widthV,
                                     double angle) const = 0;
};

/**
 * @brief Hexagonal lattice of touching ellipses
 *
 * Neighbouring centres sit two widths apart along the ellipse axes, so the
 * responses of adjacent beams cross at the overlap level the widths were
 * derived for. Results are ordered by distance from the boresight, then by
 * position angle.
 */
class EllipsePacker : public PackingEngine {
public:
    explicit EllipsePacker(int num_threads = 4);

    PackingResult compact(int beam_count, double widthH, double widthV,
                          double angle, int precision) const override;

    std::vector<Offset> grid(double radius, double widthH, double widthV,
                             double angle) const override;

    /**
     * @brief Largest distance of any ellipse outline point from the boresight
     */
    static double circumscribingRadius(const std::vector<Offset>& centres,
                                       double widthH, double widthV, double angle);

private:
    int num_threads_;

    static constexpr int OUTLINE_SAMPLES = 180;
    static constexpr long MAX_LATTICE_HALF_EXTENT = 4000;

    struct Lattice {
        double widthH, widthV, angle;
        double origin_i, origin_j;

        Offset point(long i, long j) const;
    };

    static std::vector<Offset> latticeWithin(const Lattice& lattice, double radius);
    static void sortCanonical(std::vector<Offset>& points);
    static void checkWidths(double widthH, double widthV);
};

} // namespace mosaic

#endif // MOSAIC_PACKING_HPP
