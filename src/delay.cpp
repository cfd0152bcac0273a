#include "mosaic/delay.hpp"
#include "mosaic/errors.hpp"
#include "mosaic/utils.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace mosaic {

GeometricDelayCorrection::GeometricDelayCorrection(AntennaGeometry antennas,
                                                   const GeoCoordinate& reference,
                                                   double frequency,
                                                   int polarizations)
    : antennas_(std::move(antennas)),
      frequency_(frequency),
      polarizations_(polarizations)
{
    if (!(frequency_ > 0.0)) {
        throw std::invalid_argument("Delay frequency must be positive");
    }
    if (polarizations_ < 1) {
        throw std::invalid_argument("Number of polarizations must be at least 1");
    }

    Ecef ref = geodeticToEcef(reference);
    baselines_.reserve(antennas_.size());
    for (const auto& ant : antennas_) {
        Ecef pos = geodeticToEcef(ant);
        baselines_.push_back(Ecef{pos.x - ref.x, pos.y - ref.y, pos.z - ref.z});
    }
}

DelayCorrections GeometricDelayCorrection::corrections(const Target& target,
                                                       std::pair<double, double> window) const {
    double t0 = window.first;
    double t1 = window.second;
    if (!(t1 > t0)) {
        throw std::invalid_argument("Delay window must have positive length");
    }

    Ecef s0 = sourceDirectionEcef(target.ra, target.dec, epochToMjd(t0));
    Ecef s1 = sourceDirectionEcef(target.ra, target.dec, epochToMjd(t1));

    DelayCorrections result;
    result.channel_ids.reserve(baselines_.size() * polarizations_);
    result.samples.reserve(baselines_.size() * polarizations_);

    for (size_t a = 0; a < baselines_.size(); a++) {
        const Ecef& b = baselines_[a];
        double d0 = (b.x * s0.x + b.y * s0.y + b.z * s0.z) / C_LIGHT;
        double d1 = (b.x * s1.x + b.y * s1.y + b.z * s1.z) / C_LIGHT;
        double rate = (d1 - d0) / (t1 - t0);

        std::vector<DelaySample> samples = {
            {d0, rate, 2.0 * PI * frequency_ * d0},
            {d1, rate, 2.0 * PI * frequency_ * d1}
        };

        for (int p = 0; p < polarizations_; p++) {
            result.channel_ids.push_back("ant" + std::to_string(a) + "p" + std::to_string(p));
            result.samples.push_back(samples);
        }
    }
    return result;
}

DelayPolynomial::DelayPolynomial(const std::vector<AntennaInput>& antennas,
                                 const std::vector<TargetInput>& targets,
                                 const AntennaInput& reference,
                                 double frequency,
                                 const DelaySelectionPolicy& policy,
                                 std::shared_ptr<const DelayOracle> oracle)
    : frequency_(frequency),
      policy_(policy),
      oracle_(std::move(oracle))
{
    if (antennas.empty()) {
        throw std::invalid_argument("Delay calculation needs at least one antenna");
    }
    if (targets.empty()) {
        throw std::invalid_argument("Delay calculation needs at least one target");
    }
    if (policy_.polarizations < 1 || policy_.polarization_index < 0
        || policy_.polarization_index >= policy_.polarizations || policy_.sample_index < 0) {
        throw std::invalid_argument("Invalid delay selection policy");
    }

    antennas_ = resolveAntennas(antennas);
    targets_ = resolveTargets(targets);
    reference_ = resolveAntenna(reference);

    if (!oracle_) {
        oracle_ = std::make_shared<GeometricDelayCorrection>(antennas_, reference_, frequency_,
                                                             policy_.polarizations);
    }
}

DelayTable DelayPolynomial::getDelayPolynomials(const TimeInput& epoch, double duration) const {
    if (!(duration > 0.0)) {
        throw std::invalid_argument("Delay duration must be positive");
    }

    double timestamp = resolveEpoch(epoch);
    std::pair<double, double> window(timestamp, timestamp + duration);

    const size_t n_channels = antennas_.size() * policy_.polarizations;

    DelayTable table;
    table.n_targets = targets_.size();
    table.n_antennas = antennas_.size();
    table.values.resize(table.n_targets * table.n_antennas);

    std::cout << "=== Delay Polynomials ===" << std::endl;
    std::cout << "Targets: " << table.n_targets << ", antennas: " << table.n_antennas
              << ", window: " << duration << " s" << std::endl;

    for (size_t t = 0; t < targets_.size(); t++) {
        DelayCorrections corr = oracle_->corrections(targets_[t], window);
        if (corr.samples.size() != n_channels) {
            throw MosaicError("Delay oracle returned " + std::to_string(corr.samples.size())
                              + " channels for target '" + targets_[t].name + "', expected "
                              + std::to_string(n_channels));
        }

        for (size_t a = 0; a < antennas_.size(); a++) {
            const auto& channel = corr.samples[a * policy_.polarizations + policy_.polarization_index];
            if (channel.size() <= static_cast<size_t>(policy_.sample_index)) {
                throw MosaicError("Delay oracle returned " + std::to_string(channel.size())
                                  + " samples, sample " + std::to_string(policy_.sample_index)
                                  + " requested");
            }
            const DelaySample& s = channel[policy_.sample_index];
            table(t, a) = DelayTerms{s.delay, s.rate};
        }
    }

    // Relative to the boresight beam; walk backwards so row 0 is subtracted last
    for (size_t t = table.n_targets; t-- > 0;) {
        for (size_t a = 0; a < table.n_antennas; a++) {
            table(t, a).delay -= table(0, a).delay;
            table(t, a).rate -= table(0, a).rate;
        }
    }

    std::cout << "=== Delays Complete ===" << std::endl;
    return table;
}

bool writeDelayTable(const std::string& filename, const DelayTable& table,
                     const std::vector<Target>& targets) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Cannot open delay file: " << filename << std::endl;
        return false;
    }

    // Row 0 is the reference pointing, beam indices start at row 1
    file << "# beam antenna delay(s) rate(s/s)   target\n";
    file << "# ref: reference pointing, all delays are relative to it\n";
    file << std::scientific << std::setprecision(12);
    for (size_t t = 0; t < table.n_targets; t++) {
        std::string name = t < targets.size() ? targets[t].description() : "";
        std::string beam = (t == 0) ? "ref" : std::to_string(t - 1);
        for (size_t a = 0; a < table.n_antennas; a++) {
            file << beam << " " << a << " " << table(t, a).delay << " " << table(t, a).rate
                 << "   " << name << "\n";
        }
    }

    if (!file) {
        std::cerr << "Error writing delay file: " << filename << std::endl;
        return false;
    }
    std::cout << "Wrote " << filename << std::endl;
    return true;
}

} // namespace mosaic
