/**
 * @file observation.hpp
 * @brief Observation engine: array geometry + pointing + time -> PSF
 *
 * The engine keeps the current boresight and observe time as internal state.
 * A caller must own an engine exclusively for the whole
 * setBoreSight -> setObserveTime -> createContour -> get* sequence.
 */

#ifndef MOSAIC_OBSERVATION_HPP
#define MOSAIC_OBSERVATION_HPP

#include "mosaic/coordinates.hpp"

#include <array>
#include <complex>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace mosaic {

/**
 * @brief Synthesized beam raster, centred on the boresight
 */
struct PointSpreadFunction {
    int nx = 0;
    int ny = 0;
    std::vector<float> image;          // row-major [y][x], peak normalised to 1
    EquatorialCoordinate bore_sight;   // degrees
    double width = 0.0;                // degrees spanned by the image
};

/**
 * @brief Half-maximum ellipse of the main lobe, degrees
 */
struct BeamAxis {
    double axisH;   // semi-major axis
    double axisV;   // semi-minor axis
    double angle;   // orientation of axisH, counter-clockwise from +x (RA)
};

/**
 * @brief Interface of the engine that synthesizes the PSF
 */
class ObservationEngine {
public:
    virtual ~ObservationEngine() = default;

    virtual void setBoreSight(const EquatorialCoordinate& bore_sight) = 0;
    virtual void setObserveTime(double epoch_seconds) = 0;
    virtual void createContour(const AntennaGeometry& antennas) = 0;

    virtual BeamAxis getBeamAxis() const = 0;

    /**
     * @brief Boresight (azimuth, elevation) in radians
     */
    virtual std::pair<double, double> getHorizontal() const = 0;

    virtual std::shared_ptr<const PointSpreadFunction> getPointSpreadFunction() const = 0;
};

struct PsfOptions {
    int image_density = 1024;    // Image pixels per side (even)
    int psf_oversampling = 40;   // Pixels per fringe of the longest baseline
    int num_threads = 4;
};

/**
 * @brief Snapshot interferometric observation using uv gridding and FFTW
 */
class InterferometryObservation : public ObservationEngine {
public:
    InterferometryObservation(const GeoCoordinate& reference,
                              std::vector<double> wavelengths,
                              const PsfOptions& options = PsfOptions());

    void setBoreSight(const EquatorialCoordinate& bore_sight) override;
    void setObserveTime(double epoch_seconds) override;
    void createContour(const AntennaGeometry& antennas) override;

    BeamAxis getBeamAxis() const override;
    std::pair<double, double> getHorizontal() const override;
    std::shared_ptr<const PointSpreadFunction> getPointSpreadFunction() const override;

    // uv sampling of the last contour, wavelengths, both halves of the plane
    const std::vector<std::array<double, 2>>& getProjectedBaselines() const;
    size_t getBaselinesNumber() const;

    // Image width in degrees
    double getImageLength() const;

private:
    GeoCoordinate reference_;
    std::vector<double> wavelengths_;
    PsfOptions options_;

    std::optional<EquatorialCoordinate> bore_sight_;
    std::optional<double> epoch_;

    bool contour_ready_ = false;
    size_t n_baselines_ = 0;
    double cell_rad_ = 0.0;
    double azimuth_ = 0.0;
    double elevation_ = 0.0;
    BeamAxis axis_ = {0.0, 0.0, 0.0};
    std::vector<std::array<double, 2>> uv_;
    std::shared_ptr<const PointSpreadFunction> psf_;

    void projectBaselines(const AntennaGeometry& antennas, double mjd);
    void computePSF();
    void fitBeamAxis(const PointSpreadFunction& psf);
    void requireContour() const;

    void fft(std::vector<std::complex<float>>& data, int nx, int ny);
    void fftshift(std::vector<std::complex<float>>& data, int nx, int ny);
};

} // namespace mosaic

#endif // MOSAIC_OBSERVATION_HPP
