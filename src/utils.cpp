#include "mosaic/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace mosaic {

// String utilities
std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

void trim(std::string& s) {
    // Left trim
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
    // Right trim
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

bool parseKeyValue(const std::string& line, std::string& key, std::string& value) {
    size_t pos = line.find_first_of(" \t");
    if (pos == std::string::npos) return false;

    key = line.substr(0, pos);
    trim(key);

    value = line.substr(pos + 1);
    // Remove comment
    size_t comment_pos = value.find('!');
    if (comment_pos != std::string::npos) {
        value = value.substr(0, comment_pos);
    }
    trim(value);

    return !key.empty() && !value.empty();
}

double normInverse(double fraction, double mean, double sigma) {
    return mean + sigma * std::sqrt(-2.0 * std::log(fraction));
}

double ellipticalGaussian(double dx, double dy,
                          double sigma_h, double sigma_v, double angle_deg) {
    double theta = deg2rad(angle_deg);
    double c = std::cos(theta);
    double s = std::sin(theta);

    // Rotate into the ellipse frame
    double xh = dx * c + dy * s;
    double yv = -dx * s + dy * c;

    double qh = xh / sigma_h;
    double qv = yv / sigma_v;
    return std::exp(-0.5 * (qh * qh + qv * qv));
}

} // namespace mosaic
