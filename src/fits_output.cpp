/**
 * @file fits_output.cpp
 * @brief FITS image output utilities
 */

#include "mosaic/fits_output.hpp"

#include <fitsio.h>
#include <iostream>
#include <vector>

namespace mosaic {

namespace {

bool closeWithStatus(fitsfile* fptr, int status, const std::string& filename) {
    fits_close_file(fptr, &status);
    if (status) {
        std::cerr << "FITS error in " << filename << ":" << std::endl;
        fits_report_error(stderr, status);
        return false;
    }
    return true;
}

void writeAxis(fitsfile* fptr, int axis, const char* ctype,
               double crpix, double crval, double cdelt, int* status) {
    std::string n = std::to_string(axis);
    fits_write_key(fptr, TSTRING, ("CTYPE" + n).c_str(), (void*)ctype, "Coordinate type", status);
    fits_write_key(fptr, TDOUBLE, ("CRPIX" + n).c_str(), &crpix, "Reference pixel", status);
    fits_write_key(fptr, TDOUBLE, ("CRVAL" + n).c_str(), &crval, "Reference value (deg)", status);
    fits_write_key(fptr, TDOUBLE, ("CDELT" + n).c_str(), &cdelt, "Pixel size (deg)", status);
    fits_write_key(fptr, TSTRING, ("CUNIT" + n).c_str(), (void*)"deg", "Axis unit", status);
}

} // namespace

bool writePsfFits(const std::string& filename, const BeamShape& beam_shape) {
    const auto& psf = beam_shape.psf();
    if (!psf || psf->image.empty()) {
        std::cerr << "No PSF to write to " << filename << std::endl;
        return false;
    }

    std::cout << "=== Writing PSF FITS ===" << std::endl;
    std::cout << "Output: " << filename << std::endl;

    fitsfile* fptr = nullptr;
    int status = 0;

    std::string full_path = "!" + filename;  // ! = overwrite
    if (fits_create_file(&fptr, full_path.c_str(), &status)) {
        std::cerr << "Error creating FITS file: " << filename << std::endl;
        fits_report_error(stderr, status);
        return false;
    }

    long naxes[2] = {psf->nx, psf->ny};
    if (fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status)) {
        std::cerr << "Error creating image HDU" << std::endl;
        return closeWithStatus(fptr, status, filename);
    }

    fits_write_key(fptr, TSTRING, "OBJECT", (void*)"PSF", "Synthesized beam", &status);
    fits_write_key(fptr, TSTRING, "ORIGIN", (void*)"mosaic", "Software", &status);

    // Pixel x increases with RA; the peak sits at index n/2 after the shift
    double cell_deg = psf->width / psf->nx;
    writeAxis(fptr, 1, "RA---SIN", psf->nx / 2 + 1.0, psf->bore_sight.ra, cell_deg, &status);
    writeAxis(fptr, 2, "DEC--SIN", psf->ny / 2 + 1.0, psf->bore_sight.dec, cell_deg, &status);

    double bmaj = 2.0 * beam_shape.axisH();
    double bmin = 2.0 * beam_shape.axisV();
    double bpa = 90.0 - beam_shape.angle();   // east of north
    fits_write_key(fptr, TDOUBLE, "BMAJ", &bmaj, "Beam major axis FWHM (deg)", &status);
    fits_write_key(fptr, TDOUBLE, "BMIN", &bmin, "Beam minor axis FWHM (deg)", &status);
    fits_write_key(fptr, TDOUBLE, "BPA", &bpa, "Beam position angle (deg)", &status);

    const auto& horizon = beam_shape.horizon();
    double azimuth = horizon.azimuth;
    double elevation = horizon.elevation;
    fits_write_key(fptr, TDOUBLE, "AZIMUTH", &azimuth, "Boresight azimuth (deg)", &status);
    fits_write_key(fptr, TDOUBLE, "ELEVATIO", &elevation, "Boresight elevation (deg)", &status);
    int n_ant = static_cast<int>(beam_shape.antennas().size());
    fits_write_key(fptr, TINT, "NANTENNA", &n_ant, "Antennas in the array", &status);

    double equinox = 2000.0;
    fits_write_key(fptr, TDOUBLE, "EQUINOX", &equinox, "Equinox of coordinates", &status);

    long fpixel[2] = {1, 1};
    std::vector<float> data(psf->image);
    if (fits_write_pix(fptr, TFLOAT, fpixel, static_cast<long>(data.size()),
                       data.data(), &status)) {
        std::cerr << "Error writing image data" << std::endl;
        return closeWithStatus(fptr, status, filename);
    }

    if (!closeWithStatus(fptr, status, filename)) {
        return false;
    }

    std::cout << "Wrote FITS image: " << filename << " (" << psf->nx << "x" << psf->ny << ")" << std::endl;
    return true;
}

bool writeOverlapFits(const std::string& filename, const Overlap& overlap,
                      const EquatorialCoordinate& bore_sight) {
    const OverlapGrid& grid = overlap.metrics();

    std::cout << "=== Writing Overlap FITS ===" << std::endl;
    std::cout << "Output: " << filename << std::endl;

    fitsfile* fptr = nullptr;
    int status = 0;

    std::string full_path = "!" + filename;  // ! = overwrite
    if (fits_create_file(&fptr, full_path.c_str(), &status)) {
        std::cerr << "Error creating FITS file: " << filename << std::endl;
        fits_report_error(stderr, status);
        return false;
    }

    long naxes[2] = {grid.nx, grid.ny};
    if (fits_create_img(fptr, DOUBLE_IMG, 2, naxes, &status)) {
        std::cerr << "Error creating image HDU" << std::endl;
        return closeWithStatus(fptr, status, filename);
    }

    std::string mode = toString(overlap.mode());
    fits_write_key(fptr, TSTRING, "OBJECT", (void*)mode.c_str(), "Overlap mode", &status);
    fits_write_key(fptr, TSTRING, "ORIGIN", (void*)"mosaic", "Software", &status);

    // Sample i sits at -extent + i * step
    double step = grid.step() > 0.0 ? grid.step() : 1.0;
    double crpix1 = (grid.nx + 1) / 2.0;
    double crpix2 = (grid.ny + 1) / 2.0;
    writeAxis(fptr, 1, "RA---TAN", crpix1, bore_sight.ra, step, &status);
    writeAxis(fptr, 2, "DEC--TAN", crpix2, bore_sight.dec, step, &status);

    long fpixel[2] = {1, 1};
    std::vector<double> data(grid.values);
    if (fits_write_pix(fptr, TDOUBLE, fpixel, static_cast<long>(data.size()),
                       data.data(), &status)) {
        std::cerr << "Error writing image data" << std::endl;
        return closeWithStatus(fptr, status, filename);
    }

    if (!closeWithStatus(fptr, status, filename)) {
        return false;
    }

    std::cout << "Wrote FITS image: " << filename << " (" << grid.nx << "x" << grid.ny << ")" << std::endl;
    return true;
}

} // namespace mosaic
