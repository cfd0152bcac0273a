/**
 * @file ephemeris.hpp
 * @brief Normalisation of antenna, target and time inputs
 *
 * Callers may hand antennas, pointing targets and timestamps over either as
 * plain literals or as ephemeris handles (or their description strings).
 * Everything is resolved here, once, so the rest of the pipeline only ever
 * sees GeoCoordinate, EquatorialCoordinate and epoch seconds.
 */

#ifndef MOSAIC_EPHEMERIS_HPP
#define MOSAIC_EPHEMERIS_HPP

#include "mosaic/coordinates.hpp"

#include <string>
#include <variant>
#include <vector>

namespace mosaic {

/**
 * @brief Ephemeris antenna handle, angles in radians
 */
struct Antenna {
    std::string name;
    double latitude;   // radians
    double longitude;  // radians
    double elevation;  // meters

    /**
     * @brief Parse "name, lat, lon, alt" with D:M:S or decimal degrees
     */
    static Antenna fromDescription(const std::string& description);
    static Antenna fromGeo(const std::string& name, const GeoCoordinate& geo);

    GeoCoordinate geo() const;
};

/**
 * @brief Ephemeris target handle, angles in radians
 */
struct Target {
    std::string name;
    double ra;   // radians
    double dec;  // radians

    /**
     * @brief Parse "radec, RA, DEC" or "name, radec, RA, DEC"
     *
     * Sexagesimal RA is in hours, decimal RA in degrees. DEC is D:M:S or
     * decimal degrees.
     */
    static Target fromDescription(const std::string& description);
    static Target fromEquatorial(const EquatorialCoordinate& radec);

    EquatorialCoordinate equatorial() const;
    std::string description() const;
};

/**
 * @brief Civil UTC timestamp
 */
struct DateTime {
    int year;
    int month;
    int day;
    int hour = 0;
    int minute = 0;
    double second = 0.0;

    /**
     * @brief Parse "YYYY-MM-DD HH:MM:SS[.fff]" (or with a 'T' separator)
     */
    static DateTime parse(const std::string& text);
};

using AntennaInput = std::variant<GeoCoordinate, Antenna, std::string>;
using TargetInput = std::variant<EquatorialCoordinate, Target, std::string>;
using TimeInput = std::variant<double, DateTime>;

GeoCoordinate resolveAntenna(const AntennaInput& antenna);
AntennaGeometry resolveAntennas(const std::vector<AntennaInput>& antennas);
EquatorialCoordinate resolveSource(const TargetInput& source);
Target resolveTarget(const TargetInput& target);
std::vector<Target> resolveTargets(const std::vector<TargetInput>& targets);
double resolveEpoch(const TimeInput& time);

double datetimeToEpoch(const DateTime& time);

// Sexagesimal formatting
std::string angleToHour(double deg);
std::string angleToDec(double deg);

// Sexagesimal parsing, result in the unit of the leading field
double parseSexagesimal(const std::string& text);

/**
 * @brief Load an antenna list, one "lat lon alt" or description per line
 */
AntennaGeometry loadAntennaFile(const std::string& filename);

} // namespace mosaic

#endif // MOSAIC_EPHEMERIS_HPP
