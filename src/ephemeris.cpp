#include "mosaic/ephemeris.hpp"
#include "mosaic/errors.hpp"
#include "mosaic/utils.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

namespace mosaic {

namespace {

double parseNumber(const std::string& text) {
    std::string s = text;
    trim(s);
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(s, &used);
    } catch (const std::exception&) {
        throw InvalidInputTypeError("Not a number: '" + text + "'");
    }
    if (used != s.size() || !std::isfinite(value)) {
        throw InvalidInputTypeError("Not a number: '" + text + "'");
    }
    return value;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return days[month - 1];
}

// Days since 1970-01-01 of a proleptic Gregorian date
long daysFromCivil(long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

void checkFinite(double value, const char* what) {
    if (!std::isfinite(value)) {
        throw InvalidInputTypeError(std::string("Non-finite ") + what);
    }
}

// Split a fractional quantity into whole units, minutes and seconds;
// a non-zero wrap folds the leading unit after rounding
std::string formatSexagesimal(double value, bool force_sign, int second_decimals,
                              long long wrap = 0) {
    double scale = std::pow(10.0, second_decimals);
    double total = std::round(std::fabs(value) * 3600.0 * scale);

    long long units = static_cast<long long>(total / (3600.0 * scale));
    total -= units * 3600.0 * scale;
    if (wrap > 0) units %= wrap;
    int minutes = static_cast<int>(total / (60.0 * scale));
    total -= minutes * 60.0 * scale;
    double seconds = total / scale;

    char buffer[64];
    const char* sign = (value < 0) ? "-" : (force_sign ? "+" : "");
    std::snprintf(buffer, sizeof(buffer), "%s%02lld:%02d:%0*.*f",
                  sign, units, minutes,
                  second_decimals + 3, second_decimals, seconds);
    return buffer;
}

} // namespace

double parseSexagesimal(const std::string& text) {
    std::string s = text;
    trim(s);
    if (s.empty()) {
        throw InvalidInputTypeError("Empty angle");
    }

    auto fields = split(s, ':');
    if (fields.empty() || fields.size() > 3) {
        throw InvalidInputTypeError("Malformed angle: '" + text + "'");
    }

    bool negative = (s[0] == '-');
    double value = 0.0;
    double unit = 1.0;
    for (size_t i = 0; i < fields.size(); i++) {
        double part = std::fabs(parseNumber(fields[i]));
        if (i > 0 && part >= 60.0) {
            throw InvalidInputTypeError("Malformed angle: '" + text + "'");
        }
        value += part / unit;
        unit *= 60.0;
    }
    return negative ? -value : value;
}

Antenna Antenna::fromDescription(const std::string& description) {
    auto fields = split(description, ',');
    if (fields.size() < 4) {
        throw InvalidInputTypeError("Antenna description needs 'name, lat, lon, alt': '"
                                    + description + "'");
    }

    Antenna antenna;
    antenna.name = fields[0];
    antenna.latitude = deg2rad(parseSexagesimal(fields[1]));
    antenna.longitude = deg2rad(parseSexagesimal(fields[2]));
    antenna.elevation = parseNumber(fields[3]);

    if (std::fabs(antenna.latitude) > PI / 2) {
        throw InvalidInputTypeError("Antenna latitude out of range: '" + description + "'");
    }
    return antenna;
}

Antenna Antenna::fromGeo(const std::string& name, const GeoCoordinate& geo) {
    return Antenna{name, deg2rad(geo.latitude), deg2rad(geo.longitude), geo.altitude};
}

GeoCoordinate Antenna::geo() const {
    return GeoCoordinate{rad2deg(latitude), rad2deg(longitude), elevation};
}

Target Target::fromDescription(const std::string& description) {
    auto fields = split(description, ',');

    // Optional leading name
    size_t tag = 0;
    std::string name;
    if (fields.size() == 4) {
        name = fields[0];
        tag = 1;
    } else if (fields.size() != 3) {
        throw InvalidInputTypeError("Target description needs 'radec, RA, DEC': '"
                                    + description + "'");
    }
    if (fields[tag] != "radec") {
        throw InvalidInputTypeError("Unsupported target type '" + fields[tag] + "'");
    }

    const std::string& ra_text = fields[tag + 1];
    double ra_deg = parseSexagesimal(ra_text);
    if (ra_text.find(':') != std::string::npos) {
        ra_deg *= 15.0;  // hours
    }
    double dec_deg = parseSexagesimal(fields[tag + 2]);
    if (std::fabs(dec_deg) > 90.0) {
        throw InvalidInputTypeError("Declination out of range: '" + description + "'");
    }

    Target target;
    target.ra = deg2rad(ra_deg);
    target.dec = deg2rad(dec_deg);
    target.name = name.empty() ? target.description() : name;
    return target;
}

Target Target::fromEquatorial(const EquatorialCoordinate& radec) {
    Target target;
    target.ra = deg2rad(radec.ra);
    target.dec = deg2rad(radec.dec);
    target.name = target.description();
    return target;
}

EquatorialCoordinate Target::equatorial() const {
    return EquatorialCoordinate{rad2deg(ra), rad2deg(dec)};
}

std::string Target::description() const {
    return "radec, " + angleToHour(rad2deg(ra)) + ", " + angleToDec(rad2deg(dec));
}

DateTime DateTime::parse(const std::string& text) {
    DateTime t{};
    std::string s = text;
    trim(s);
    for (auto& ch : s) {
        if (ch == 'T') ch = ' ';
    }

    char trailing = 0;
    int n = std::sscanf(s.c_str(), "%d-%d-%d %d:%d:%lf %c",
                        &t.year, &t.month, &t.day,
                        &t.hour, &t.minute, &t.second, &trailing);
    if (n != 3 && n != 6) {
        throw InvalidInputTypeError("Malformed date/time: '" + text + "'");
    }
    return t;
}

double datetimeToEpoch(const DateTime& time) {
    if (time.month < 1 || time.month > 12 ||
        time.day < 1 || time.day > daysInMonth(time.year, time.month) ||
        time.hour < 0 || time.hour > 23 ||
        time.minute < 0 || time.minute > 59 ||
        !(time.second >= 0.0 && time.second < 61.0)) {
        throw InvalidInputTypeError("Invalid calendar date/time");
    }

    long days = daysFromCivil(time.year, static_cast<unsigned>(time.month),
                              static_cast<unsigned>(time.day));
    return days * SECONDS_PER_DAY + time.hour * 3600.0 + time.minute * 60.0 + time.second;
}

GeoCoordinate resolveAntenna(const AntennaInput& antenna) {
    GeoCoordinate geo;
    if (const auto* literal = std::get_if<GeoCoordinate>(&antenna)) {
        geo = *literal;
    } else if (const auto* handle = std::get_if<Antenna>(&antenna)) {
        geo = handle->geo();
    } else {
        geo = Antenna::fromDescription(std::get<std::string>(antenna)).geo();
    }

    checkFinite(geo.latitude, "antenna latitude");
    checkFinite(geo.longitude, "antenna longitude");
    checkFinite(geo.altitude, "antenna altitude");
    if (std::fabs(geo.latitude) > 90.0) {
        throw InvalidInputTypeError("Antenna latitude out of range");
    }
    return geo;
}

AntennaGeometry resolveAntennas(const std::vector<AntennaInput>& antennas) {
    AntennaGeometry geometry;
    geometry.reserve(antennas.size());
    for (const auto& antenna : antennas) {
        geometry.push_back(resolveAntenna(antenna));
    }
    return geometry;
}

EquatorialCoordinate resolveSource(const TargetInput& source) {
    return resolveTarget(source).equatorial();
}

Target resolveTarget(const TargetInput& target) {
    Target resolved;
    if (const auto* literal = std::get_if<EquatorialCoordinate>(&target)) {
        checkFinite(literal->ra, "right ascension");
        checkFinite(literal->dec, "declination");
        if (std::fabs(literal->dec) > 90.0) {
            throw InvalidInputTypeError("Declination out of range");
        }
        resolved = Target::fromEquatorial(*literal);
    } else if (const auto* handle = std::get_if<Target>(&target)) {
        checkFinite(handle->ra, "right ascension");
        checkFinite(handle->dec, "declination");
        resolved = *handle;
    } else {
        resolved = Target::fromDescription(std::get<std::string>(target));
    }
    return resolved;
}

std::vector<Target> resolveTargets(const std::vector<TargetInput>& targets) {
    std::vector<Target> resolved;
    resolved.reserve(targets.size());
    for (const auto& target : targets) {
        resolved.push_back(resolveTarget(target));
    }
    return resolved;
}

double resolveEpoch(const TimeInput& time) {
    if (const auto* seconds = std::get_if<double>(&time)) {
        checkFinite(*seconds, "epoch");
        return *seconds;
    }
    return datetimeToEpoch(std::get<DateTime>(time));
}

std::string angleToHour(double deg) {
    double hours = std::fmod(deg, 360.0);
    if (hours < 0) hours += 360.0;
    return formatSexagesimal(hours / 15.0, false, 3, 24);
}

std::string angleToDec(double deg) {
    return formatSexagesimal(deg, true, 2);
}

AntennaGeometry loadAntennaFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open antenna file: " + filename);
    }

    AntennaGeometry antennas;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        size_t comment = line.find('#');
        if (comment != std::string::npos) line = line.substr(0, comment);
        trim(line);
        if (line.empty()) continue;

        if (line.find(',') != std::string::npos) {
            antennas.push_back(resolveAntenna(line));
            continue;
        }

        std::istringstream fields(line);
        GeoCoordinate geo;
        if (!(fields >> geo.latitude >> geo.longitude >> geo.altitude)) {
            throw InvalidInputTypeError("Bad antenna entry at " + filename + ":"
                                        + std::to_string(line_no));
        }
        antennas.push_back(resolveAntenna(geo));
    }

    std::cout << "Loaded " << antennas.size() << " antennas from " << filename << std::endl;
    return antennas;
}

} // namespace mosaic
