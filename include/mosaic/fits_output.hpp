/**
 * @file fits_output.hpp
 * @brief FITS output of the PSF raster and overlap grids
 */

#ifndef MOSAIC_FITS_OUTPUT_HPP
#define MOSAIC_FITS_OUTPUT_HPP

#include "mosaic/beam_shape.hpp"
#include "mosaic/overlap.hpp"

#include <string>

namespace mosaic {

/**
 * @brief Write the PSF of a beam shape with BMAJ/BMIN/BPA keywords
 *
 * The beam keywords carry the full widths at half maximum, i.e. twice the
 * fitted semi-axes.
 */
bool writePsfFits(const std::string& filename, const BeamShape& beam_shape);

/**
 * @brief Write an overlap grid centred on the boresight
 */
bool writeOverlapFits(const std::string& filename, const Overlap& overlap,
                      const EquatorialCoordinate& bore_sight);

} // namespace mosaic

#endif // MOSAIC_FITS_OUTPUT_HPP
