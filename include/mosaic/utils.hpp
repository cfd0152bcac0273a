#ifndef MOSAIC_UTILS_HPP
#define MOSAIC_UTILS_HPP

#include <string>
#include <vector>

namespace mosaic {

// String parsing
std::vector<std::string> split(const std::string& s, char delim);
void trim(std::string& s);
bool parseKeyValue(const std::string& line, std::string& key, std::string& value);

// Gaussian helpers

/**
 * @brief Offset from the mean at which a normal distribution drops to
 *        the given fraction of its peak
 */
double normInverse(double fraction, double mean, double sigma);

/**
 * @brief Elliptical Gaussian response normalised to 1 at the centre
 *
 * (dx, dy) is the offset from the centre in the same unit as the sigmas,
 * angle_deg the orientation of the sigma_h axis counter-clockwise from +x.
 */
double ellipticalGaussian(double dx, double dy,
                          double sigma_h, double sigma_v, double angle_deg);

// Constants
constexpr double C_LIGHT = 299792458.0;  // m/s
constexpr double PI = 3.141592653589793;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double SECONDS_PER_DAY = 86400.0;
constexpr double MJD_UNIX_EPOCH = 40587.0;

// 2 * sqrt(2 * ln 2), FWHM in units of sigma
constexpr double FWHM_TO_SIGMA = 2.3548200450309493;

inline double deg2rad(double deg) { return deg * DEG_TO_RAD; }
inline double rad2deg(double rad) { return rad * RAD_TO_DEG; }

} // namespace mosaic

#endif // MOSAIC_UTILS_HPP
