#ifndef MOSAIC_CONFIG_HPP
#define MOSAIC_CONFIG_HPP

#include "mosaic/coordinates.hpp"
#include "mosaic/overlap.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mosaic {

enum class TilingMode {
    BEAM_COUNT,
    RADIUS
};

class Config {
public:
    // Array
    std::string antenna_file;
    GeoCoordinate reference = {-30.71106, 21.44389, 1035.0};
    std::vector<double> frequencies = {1.4e9};

    // Pointing
    std::string source;          // "radec, RA, DEC" description, wins over RA/DEC
    double ra = 0.0;             // degrees
    double dec = -30.0;          // degrees
    double epoch = 0.0;          // seconds since 1970-01-01 UTC
    std::string datetime;        // "YYYY-MM-DD HH:MM:SS", wins over TIME

    // Tiling
    double overlap = 0.5;
    int beam_num = 400;
    double tiling_radius = 0.0;  // degrees, > 0 selects radius tiling
    int pack_precision = 10;

    // PSF
    int image_density = 1024;
    int psf_oversampling = 40;

    // Overlap
    OverlapMode overlap_mode = OverlapMode::COUNTER;
    int overlap_grid = 400;
    std::optional<double> counter_threshold;  // unset: the tiling overlap

    // Delays
    double delay_freq = 1.4e9;
    double delay_duration = 10.0;
    int n_pol = 2;
    int pol_index = 0;
    int sample_index = 0;

    // Processing
    int num_threads = 4;

    // Outputs, empty disables
    std::string psf_fits;
    std::string overlap_fits;
    std::string tiling_out;
    std::string delay_out;

    // Derived
    TilingMode tiling_mode = TilingMode::BEAM_COUNT;
    EquatorialCoordinate bore_sight = {0.0, -30.0};
    double observe_epoch = 0.0;

    // Command-line settings replace file values of the same key
    using Overrides = std::vector<std::pair<std::string, std::string>>;

    // Methods
    static Config fromFile(const std::string& filename,
                           const Overrides& overrides = Overrides());
    void validate() const;
    void computeDerived();

private:
    void parseLine(const std::string& line);
};

} // namespace mosaic

#endif // MOSAIC_CONFIG_HPP
