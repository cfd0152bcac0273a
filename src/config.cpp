#include "mosaic/config.hpp"
#include "mosaic/ephemeris.hpp"
#include "mosaic/errors.hpp"
#include "mosaic/utils.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace mosaic {

namespace {

// The whole value must parse, trailing characters are an error
double toDouble(const std::string& value) {
    size_t used = 0;
    double result = std::stod(value, &used);
    if (used != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

int toInt(const std::string& value) {
    size_t used = 0;
    int result = std::stoi(value, &used);
    if (used != value.size()) {
        throw std::invalid_argument("not an integer");
    }
    return result;
}

} // namespace

Config Config::fromFile(const std::string& filename, const Overrides& overrides) {
    Config config;

    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    std::string line;
    while (std::getline(file, line)) {
        config.parseLine(line);
    }

    for (const auto& [key, value] : overrides) {
        std::cout << "Override: " << key << " = " << value << std::endl;
        config.parseLine(key + " " + value);
    }

    config.validate();
    config.computeDerived();

    return config;
}

void Config::parseLine(const std::string& line) {
    if (line.empty() || line[0] == '*' || line[0] == '#') return;

    std::string key, value;
    if (!parseKeyValue(line, key, value)) return;

    try {
        if (key == "ANTENNAS") antenna_file = value;
        else if (key == "REF_ANTENNA") {
            auto parts = split(value, ',');
            if (parts.size() != 3) {
                throw std::invalid_argument("expected lat,lon,alt");
            }
            reference.latitude = toDouble(parts[0]);
            reference.longitude = toDouble(parts[1]);
            reference.altitude = toDouble(parts[2]);
        }
        else if (key == "FREQ") {
            frequencies.clear();
            for (const auto& f : split(value, ',')) {
                frequencies.push_back(toDouble(f));
            }
        }
        else if (key == "SOURCE") source = value;
        else if (key == "RA") ra = toDouble(value);
        else if (key == "DEC") dec = toDouble(value);
        else if (key == "TIME") epoch = toDouble(value);
        else if (key == "DATETIME") datetime = value;
        else if (key == "OVERLAP") overlap = toDouble(value);
        else if (key == "BEAM_NUM") beam_num = toInt(value);
        else if (key == "TILING_RADIUS") tiling_radius = toDouble(value);
        else if (key == "PACK_PRECISION") pack_precision = toInt(value);
        else if (key == "IMAGE_DENSITY") image_density = toInt(value);
        else if (key == "PSF_OVERSAMPLING") psf_oversampling = toInt(value);
        else if (key == "OVERLAP_MODE") overlap_mode = overlapModeFromString(value);
        else if (key == "OVERLAP_GRID") overlap_grid = toInt(value);
        else if (key == "COUNTER_THRESHOLD") counter_threshold = toDouble(value);
        else if (key == "DELAY_FREQ") delay_freq = toDouble(value);
        else if (key == "DELAY_DURATION") delay_duration = toDouble(value);
        else if (key == "NPOL") n_pol = toInt(value);
        else if (key == "POL_INDEX") pol_index = toInt(value);
        else if (key == "SAMPLE_INDEX") sample_index = toInt(value);
        else if (key == "NUM_THREADS") num_threads = toInt(value);
        else if (key == "PSF_FITS") psf_fits = value;
        else if (key == "OVERLAP_FITS") overlap_fits = value;
        else if (key == "TILING_OUT") tiling_out = value;
        else if (key == "DELAY_OUT") delay_out = value;
        else {
            std::cerr << "Warning: Unknown key " << key << std::endl;
        }
    } catch (const std::logic_error& e) {
        throw std::runtime_error("Failed to parse " + key + " = " + value
                                 + " (" + e.what() + ")");
    }
}

void Config::validate() const {
    if (!(overlap > 0.0 && overlap < 1.0)) {
        throw InvalidOverlapError("OVERLAP must lie in (0, 1)");
    }
    if (frequencies.empty()) {
        throw std::runtime_error("FREQ not set");
    }
    for (double f : frequencies) {
        if (!(f > 0.0)) {
            throw std::runtime_error("FREQ values must be positive");
        }
    }
    if (tiling_radius < 0.0) {
        throw std::runtime_error("TILING_RADIUS must not be negative");
    }
    if (tiling_radius == 0.0 && beam_num < 1) {
        throw std::runtime_error("BEAM_NUM must be at least 1");
    }
    if (pack_precision < 1) {
        throw std::runtime_error("PACK_PRECISION must be at least 1");
    }
    if (image_density < 16 || image_density % 2 != 0) {
        throw std::runtime_error("IMAGE_DENSITY must be even and at least 16");
    }
    if (psf_oversampling < 3 || image_density / psf_oversampling < 2) {
        throw std::runtime_error("PSF_OVERSAMPLING must be in [3, IMAGE_DENSITY / 2]");
    }
    if (overlap_grid < 1) {
        throw std::runtime_error("OVERLAP_GRID must be at least 1");
    }
    if (counter_threshold && !(*counter_threshold > 0.0 && *counter_threshold <= 1.0)) {
        throw std::runtime_error("COUNTER_THRESHOLD must lie in (0, 1]");
    }
    if (!(delay_freq > 0.0) || !(delay_duration > 0.0)) {
        throw std::runtime_error("DELAY_FREQ and DELAY_DURATION must be positive");
    }
    if (n_pol < 1 || pol_index < 0 || pol_index >= n_pol || sample_index < 0) {
        throw std::runtime_error("Invalid NPOL / POL_INDEX / SAMPLE_INDEX");
    }
    if (num_threads < 1) {
        throw std::runtime_error("NUM_THREADS must be at least 1");
    }
}

void Config::computeDerived() {
    tiling_mode = (tiling_radius > 0.0) ? TilingMode::RADIUS : TilingMode::BEAM_COUNT;

    if (!source.empty()) {
        bore_sight = resolveSource(source);
    } else {
        bore_sight = resolveSource(EquatorialCoordinate{ra, dec});
    }

    if (!datetime.empty()) {
        observe_epoch = resolveEpoch(DateTime::parse(datetime));
    } else {
        observe_epoch = resolveEpoch(epoch);
    }

    std::cout << "Bore sight: RA " << angleToHour(bore_sight.ra)
              << " DEC " << angleToDec(bore_sight.dec) << std::endl;
    std::cout << "Observe time: " << observe_epoch << " s (MJD "
              << epochToMjd(observe_epoch) << ")" << std::endl;
    std::cout << "Tiling: "
              << (tiling_mode == TilingMode::RADIUS
                      ? "radius " + std::to_string(tiling_radius) + " deg"
                      : std::to_string(beam_num) + " beams")
              << ", overlap " << overlap << std::endl;
}

} // namespace mosaic
