#include "mosaic/coordinates.hpp"
#include "mosaic/utils.hpp"
#include <algorithm>
#include <cmath>

namespace mosaic {

namespace {

// WGS84 ellipsoid
constexpr double WGS84_A = 6378137.0;
constexpr double WGS84_F = 1.0 / 298.257223563;
constexpr double WGS84_E2 = WGS84_F * (2.0 - WGS84_F);

double wrapTwoPi(double angle) {
    angle = std::fmod(angle, 2.0 * PI);
    if (angle < 0) angle += 2.0 * PI;
    return angle;
}

} // namespace

Ecef geodeticToEcef(const GeoCoordinate& site) {
    double lat = deg2rad(site.latitude);
    double lon = deg2rad(site.longitude);
    double sin_lat = std::sin(lat);
    double cos_lat = std::cos(lat);

    double n = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sin_lat * sin_lat);

    Ecef p;
    p.x = (n + site.altitude) * cos_lat * std::cos(lon);
    p.y = (n + site.altitude) * cos_lat * std::sin(lon);
    p.z = (n * (1.0 - WGS84_E2) + site.altitude) * sin_lat;
    return p;
}

Enu ecefToEnu(const Ecef& point, const GeoCoordinate& reference) {
    Ecef ref = geodeticToEcef(reference);
    double dx = point.x - ref.x;
    double dy = point.y - ref.y;
    double dz = point.z - ref.z;

    double lat = deg2rad(reference.latitude);
    double lon = deg2rad(reference.longitude);
    double sin_lat = std::sin(lat);
    double cos_lat = std::cos(lat);
    double sin_lon = std::sin(lon);
    double cos_lon = std::cos(lon);

    Enu enu;
    enu.e = -sin_lon * dx + cos_lon * dy;
    enu.n = -sin_lat * cos_lon * dx - sin_lat * sin_lon * dy + cos_lat * dz;
    enu.u = cos_lat * cos_lon * dx + cos_lat * sin_lon * dy + sin_lat * dz;
    return enu;
}

double epochToMjd(double epoch_seconds) {
    return epoch_seconds / SECONDS_PER_DAY + MJD_UNIX_EPOCH;
}

double gmst(double mjd) {
    double jd = mjd + 2400000.5;
    double t = (jd - 2451545.0) / 36525.0;

    double gmst_deg = 280.46061837 + 360.98564736629 * (jd - 2451545.0)
                    + 0.000387933 * t * t - t * t * t / 38710000.0;

    gmst_deg = std::fmod(gmst_deg, 360.0);
    if (gmst_deg < 0) gmst_deg += 360.0;

    return deg2rad(gmst_deg);
}

double localSiderealTime(double mjd, double lon_rad) {
    return wrapTwoPi(gmst(mjd) + lon_rad);
}

double hourAngle(double lst, double ra) {
    return lst - ra;
}

void equatorialToHorizontal(double ra_rad, double dec_rad,
                            const GeoCoordinate& site, double mjd,
                            double& az, double& el) {
    double lat = deg2rad(site.latitude);
    double ha = hourAngle(localSiderealTime(mjd, deg2rad(site.longitude)), ra_rad);

    double sin_dec = std::sin(dec_rad);
    double cos_dec = std::cos(dec_rad);
    double sin_lat = std::sin(lat);
    double cos_lat = std::cos(lat);
    double cos_ha = std::cos(ha);

    double sin_el = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;
    sin_el = std::max(-1.0, std::min(1.0, sin_el));
    el = std::asin(sin_el);

    double y = -cos_dec * std::sin(ha);
    double x = sin_dec * cos_lat - cos_dec * sin_lat * cos_ha;
    az = wrapTwoPi(std::atan2(y, x));
}

UVW projectBaseline(const Enu& baseline, double lat_rad,
                    double ha_rad, double dec_rad) {
    double sin_lat = std::sin(lat_rad);
    double cos_lat = std::cos(lat_rad);

    // Local ENU to equatorial XYZ
    double bx = -sin_lat * baseline.n + cos_lat * baseline.u;
    double by = baseline.e;
    double bz = cos_lat * baseline.n + sin_lat * baseline.u;

    double sin_ha = std::sin(ha_rad);
    double cos_ha = std::cos(ha_rad);
    double sin_dec = std::sin(dec_rad);
    double cos_dec = std::cos(dec_rad);

    UVW uvw;
    uvw.u = sin_ha * bx + cos_ha * by;
    uvw.v = -sin_dec * cos_ha * bx + sin_dec * sin_ha * by + cos_dec * bz;
    uvw.w = cos_dec * cos_ha * bx - cos_dec * sin_ha * by + sin_dec * bz;
    return uvw;
}

Ecef sourceDirectionEcef(double ra_rad, double dec_rad, double mjd) {
    double gha = gmst(mjd) - ra_rad;
    double cos_dec = std::cos(dec_rad);

    Ecef s;
    s.x = cos_dec * std::cos(gha);
    s.y = -cos_dec * std::sin(gha);
    s.z = std::sin(dec_rad);
    return s;
}

EquatorialCoordinate offsetToEquatorial(const Offset& offset,
                                        const EquatorialCoordinate& bore_sight) {
    double xi = deg2rad(offset.x);
    double eta = deg2rad(offset.y);
    double ra0 = deg2rad(bore_sight.ra);
    double dec0 = deg2rad(bore_sight.dec);

    double rho = std::sqrt(xi * xi + eta * eta);
    if (rho == 0.0) {
        return bore_sight;
    }

    double c = std::atan(rho);
    double sin_c = std::sin(c);
    double cos_c = std::cos(c);
    double sin_dec0 = std::sin(dec0);
    double cos_dec0 = std::cos(dec0);

    double dec = std::asin(cos_c * sin_dec0 + eta * sin_c * cos_dec0 / rho);
    double ra = ra0 + std::atan2(xi * sin_c,
                                 rho * cos_dec0 * cos_c - eta * sin_dec0 * sin_c);

    EquatorialCoordinate result;
    result.ra = rad2deg(wrapTwoPi(ra));
    result.dec = rad2deg(dec);
    return result;
}

} // namespace mosaic
