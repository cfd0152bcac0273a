#ifndef MOSAIC_COORDINATES_HPP
#define MOSAIC_COORDINATES_HPP

#include <vector>

namespace mosaic {

struct GeoCoordinate {
    double latitude;   // degrees
    double longitude;  // degrees
    double altitude;   // meters
};

// Order is the antenna index used by every consumer
using AntennaGeometry = std::vector<GeoCoordinate>;

struct EquatorialCoordinate {
    double ra;   // degrees
    double dec;  // degrees
};

struct HorizontalCoordinate {
    double azimuth;    // degrees, north through east
    double elevation;  // degrees
};

// Tangent-plane offset from the boresight, x toward increasing RA
struct Offset {
    double x;  // degrees
    double y;  // degrees
};

struct Ecef {
    double x, y, z;  // meters
};

struct Enu {
    double e, n, u;  // meters
};

struct UVW {
    double u, v, w;  // meters
};

// Site and time conversions
Ecef geodeticToEcef(const GeoCoordinate& site);
Enu ecefToEnu(const Ecef& point, const GeoCoordinate& reference);

double epochToMjd(double epoch_seconds);
double gmst(double mjd);                                // radians
double localSiderealTime(double mjd, double lon_rad);   // radians
double hourAngle(double lst, double ra);                // radians

/**
 * @brief Azimuth and elevation (radians) of an equatorial direction
 *
 * Azimuth runs from north through east in [0, 2pi).
 */
void equatorialToHorizontal(double ra_rad, double dec_rad,
                            const GeoCoordinate& site, double mjd,
                            double& az, double& el);

/**
 * @brief Rotate a local ENU baseline into UVW toward (ha, dec)
 */
UVW projectBaseline(const Enu& baseline, double lat_rad,
                    double ha_rad, double dec_rad);

/**
 * @brief Unit vector toward (ra, dec) in the Earth-fixed frame at mjd
 */
Ecef sourceDirectionEcef(double ra_rad, double dec_rad, double mjd);

/**
 * @brief Inverse gnomonic projection of a tangent-plane offset
 */
EquatorialCoordinate offsetToEquatorial(const Offset& offset,
                                        const EquatorialCoordinate& bore_sight);

} // namespace mosaic

#endif // MOSAIC_COORDINATES_HPP
