#include "mosaic/observation.hpp"
#include "mosaic/errors.hpp"
#include "mosaic/utils.hpp"

#include <algorithm>
#include <cmath>
#include <fftw3.h>
#include <iostream>
#include <omp.h>
#include <queue>
#include <stdexcept>

namespace mosaic {

InterferometryObservation::InterferometryObservation(const GeoCoordinate& reference,
                                                     std::vector<double> wavelengths,
                                                     const PsfOptions& options)
    : reference_(reference), wavelengths_(std::move(wavelengths)), options_(options)
{
    if (wavelengths_.empty()) {
        throw std::invalid_argument("At least one wavelength is required");
    }
    for (double lambda : wavelengths_) {
        if (!(lambda > 0.0)) {
            throw std::invalid_argument("Wavelengths must be positive");
        }
    }
    if (options_.image_density < 16 || options_.image_density % 2 != 0) {
        throw std::invalid_argument("Image density must be even and at least 16");
    }
    if (options_.psf_oversampling < 3 ||
        options_.image_density / options_.psf_oversampling < 2) {
        throw std::invalid_argument("PSF oversampling must be in [3, image_density / 2]");
    }
}

void InterferometryObservation::setBoreSight(const EquatorialCoordinate& bore_sight) {
    bore_sight_ = bore_sight;
    contour_ready_ = false;
}

void InterferometryObservation::setObserveTime(double epoch_seconds) {
    epoch_ = epoch_seconds;
    contour_ready_ = false;
}

void InterferometryObservation::createContour(const AntennaGeometry& antennas) {
    contour_ready_ = false;
    if (!bore_sight_ || !epoch_) {
        throw MosaicError("Bore sight and observe time must be set before createContour");
    }

    std::cout << "=== Computing PSF ===" << std::endl;
    std::cout << "Antennas: " << antennas.size() << std::endl;

    double mjd = epochToMjd(*epoch_);

    equatorialToHorizontal(deg2rad(bore_sight_->ra), deg2rad(bore_sight_->dec),
                           reference_, mjd, azimuth_, elevation_);
    if (elevation_ < 0) {
        std::cerr << "Warning: bore sight is below the horizon (elevation "
                  << rad2deg(elevation_) << " deg)" << std::endl;
    }

    projectBaselines(antennas, mjd);
    computePSF();
    fitBeamAxis(*psf_);
    contour_ready_ = true;

    std::cout << "Beam axis: " << axis_.axisH << " x " << axis_.axisV
              << " deg, angle " << axis_.angle << " deg" << std::endl;
    std::cout << "=== PSF Complete ===" << std::endl;
}

void InterferometryObservation::projectBaselines(const AntennaGeometry& antennas, double mjd) {
    std::vector<Enu> enu;
    enu.reserve(antennas.size());
    for (const auto& antenna : antennas) {
        enu.push_back(ecefToEnu(geodeticToEcef(antenna), reference_));
    }

    double lst = localSiderealTime(mjd, deg2rad(reference_.longitude));
    double ha = hourAngle(lst, deg2rad(bore_sight_->ra));
    double dec = deg2rad(bore_sight_->dec);
    double lat = deg2rad(reference_.latitude);

    uv_.clear();
    n_baselines_ = 0;
    for (size_t i = 0; i < enu.size(); i++) {
        for (size_t j = i + 1; j < enu.size(); j++) {
            Enu b = {enu[j].e - enu[i].e, enu[j].n - enu[i].n, enu[j].u - enu[i].u};
            UVW uvw = projectBaseline(b, lat, ha, dec);
            for (double lambda : wavelengths_) {
                uv_.push_back({uvw.u / lambda, uvw.v / lambda});
                uv_.push_back({-uvw.u / lambda, -uvw.v / lambda});
            }
            n_baselines_++;
        }
    }

    std::cout << "Baselines: " << n_baselines_ << std::endl;
}

void InterferometryObservation::computePSF() {
    const int n = options_.image_density;

    double uv_max = 0.0;
    for (const auto& p : uv_) {
        uv_max = std::max(uv_max, std::max(std::fabs(p[0]), std::fabs(p[1])));
    }
    if (uv_max <= 0.0) {
        throw MosaicError("Antennas are co-located, the baselines have no extent");
    }

    // Longest baseline lands image_density / psf_oversampling cells out
    cell_rad_ = 1.0 / (uv_max * options_.psf_oversampling);
    double scale = n * cell_rad_;

    std::vector<std::complex<float>> grid(static_cast<size_t>(n) * n, 0.0f);
    for (const auto& p : uv_) {
        int ku = static_cast<int>(std::lround(p[0] * scale));
        int kv = static_cast<int>(std::lround(p[1] * scale));
        ku = ((ku % n) + n) % n;
        kv = ((kv % n) + n) % n;
        grid[static_cast<size_t>(kv) * n + ku] += 1.0f;
    }

    fft(grid, n, n);
    fftshift(grid, n, n);

    auto psf = std::make_shared<PointSpreadFunction>();
    psf->nx = n;
    psf->ny = n;
    psf->bore_sight = *bore_sight_;
    psf->width = rad2deg(n * cell_rad_);
    psf->image.resize(grid.size());

    float peak = grid[static_cast<size_t>(n / 2) * n + n / 2].real();

    #pragma omp parallel for num_threads(options_.num_threads)
    for (int i = 0; i < n * n; i++) {
        psf->image[i] = grid[i].real() / peak;
    }

    psf_ = psf;
}

void InterferometryObservation::fitBeamAxis(const PointSpreadFunction& psf) {
    const int nx = psf.nx;
    const int ny = psf.ny;
    const int cx = nx / 2;
    const int cy = ny / 2;

    // Half-maximum region connected to the centre pixel
    std::vector<char> inside(psf.image.size(), 0);
    std::queue<std::pair<int, int>> frontier;
    frontier.push({cx, cy});
    inside[static_cast<size_t>(cy) * nx + cx] = 1;

    double sum_x = 0.0, sum_y = 0.0, sum_xx = 0.0, sum_yy = 0.0, sum_xy = 0.0;
    size_t count = 0;
    bool truncated = false;

    static const int dx[4] = {1, -1, 0, 0};
    static const int dy[4] = {0, 0, 1, -1};

    while (!frontier.empty()) {
        auto [x, y] = frontier.front();
        frontier.pop();

        double px = x - cx;
        double py = y - cy;
        sum_x += px;
        sum_y += py;
        sum_xx += px * px;
        sum_yy += py * py;
        sum_xy += px * py;
        count++;

        for (int k = 0; k < 4; k++) {
            int nx2 = x + dx[k];
            int ny2 = y + dy[k];
            if (nx2 < 0 || nx2 >= nx || ny2 < 0 || ny2 >= ny) {
                truncated = true;
                continue;
            }
            size_t idx = static_cast<size_t>(ny2) * nx + nx2;
            if (!inside[idx] && psf.image[idx] >= 0.5f) {
                inside[idx] = 1;
                frontier.push({nx2, ny2});
            }
        }
    }

    // Collinear arrays give a fringe stripe, whose fit would depend on the image size
    if (truncated) {
        throw MosaicError("Main lobe reaches the PSF image border: the array is collinear "
                          "or the image density is too small for the oversampling");
    }

    double mean_x = sum_x / count;
    double mean_y = sum_y / count;
    double cxx = sum_xx / count - mean_x * mean_x;
    double cyy = sum_yy / count - mean_y * mean_y;
    double cxy = sum_xy / count - mean_x * mean_y;

    double half_trace = 0.5 * (cxx + cyy);
    double spread = std::sqrt(0.25 * (cxx - cyy) * (cxx - cyy) + cxy * cxy);
    double lambda_major = half_trace + spread;
    double lambda_minor = std::max(0.0, half_trace - spread);

    // Uniformly filled ellipse: variance along an axis is (semi-axis)^2 / 4
    double cell_deg = rad2deg(cell_rad_);
    axis_.axisH = 2.0 * std::sqrt(lambda_major) * cell_deg;
    axis_.axisV = 2.0 * std::sqrt(lambda_minor) * cell_deg;
    axis_.angle = rad2deg(0.5 * std::atan2(2.0 * cxy, cxx - cyy));
}

void InterferometryObservation::fft(std::vector<std::complex<float>>& data, int nx, int ny) {
    fftwf_complex* buffer = reinterpret_cast<fftwf_complex*>(data.data());

    fftwf_plan plan = fftwf_plan_dft_2d(
        ny, nx,
        buffer, buffer,
        FFTW_FORWARD,
        FFTW_ESTIMATE
    );
    if (plan == nullptr) {
        throw MosaicError("FFTW failed to create a plan");
    }

    fftwf_execute(plan);
    fftwf_destroy_plan(plan);
}

void InterferometryObservation::fftshift(std::vector<std::complex<float>>& data, int nx, int ny) {
    int nx2 = nx / 2;
    int ny2 = ny / 2;

    for (int y = 0; y < ny2; y++) {
        for (int x = 0; x < nx2; x++) {
            std::swap(data[y * nx + x],
                      data[(y + ny2) * nx + (x + nx2)]);
            std::swap(data[y * nx + (x + nx2)],
                      data[(y + ny2) * nx + x]);
        }
    }
}

void InterferometryObservation::requireContour() const {
    if (!contour_ready_) {
        throw MosaicError("createContour has not run for the current bore sight and time");
    }
}

BeamAxis InterferometryObservation::getBeamAxis() const {
    requireContour();
    return axis_;
}

std::pair<double, double> InterferometryObservation::getHorizontal() const {
    requireContour();
    return {azimuth_, elevation_};
}

std::shared_ptr<const PointSpreadFunction> InterferometryObservation::getPointSpreadFunction() const {
    requireContour();
    return psf_;
}

const std::vector<std::array<double, 2>>& InterferometryObservation::getProjectedBaselines() const {
    requireContour();
    return uv_;
}

size_t InterferometryObservation::getBaselinesNumber() const {
    requireContour();
    return n_baselines_;
}

double InterferometryObservation::getImageLength() const {
    requireContour();
    return psf_->width;
}

} // namespace mosaic
