/**
 * @file main.cpp
 * @brief Multi-beam tiling planner - command line interface
 *
 * Usage:
 *   mosaic_tiler -u params.txt [options]
 *
 * Options:
 *   -u FILE    Parameter file (KEY value format)
 *   -a FILE    Antenna file, overrides ANTENNAS
 *   -n NUM     Number of beams, overrides BEAM_NUM
 *   -r DEG     Tiling radius in degrees, overrides TILING_RADIUS
 *   -o FRAC    Overlap fraction, overrides OVERLAP
 *   -m MODE    Overlap mode: counter, heater
 *   -t THREADS Number of threads
 *   -h         Show help
 */

#include "mosaic/config.hpp"
#include "mosaic/delay.hpp"
#include "mosaic/ephemeris.hpp"
#include "mosaic/fits_output.hpp"
#include "mosaic/psf_sim.hpp"
#include "mosaic/tiling.hpp"

#include <exception>
#include <getopt.h>
#include <iostream>

void print_usage(const char* prog) {
    std::cout << "Multi-beam tiling planner\n\n";
    std::cout << "Usage: " << prog << " -u param_file [options]\n\n";
    std::cout << "Required:\n";
    std::cout << "  -u FILE    Parameter file\n\n";
    std::cout << "Optional:\n";
    std::cout << "  -a FILE    Antenna file (one \"lat lon alt\" per line)\n";
    std::cout << "  -n NUM     Number of beams to tile\n";
    std::cout << "  -r DEG     Tiling radius in degrees (selects radius tiling)\n";
    std::cout << "  -o FRAC    Overlap fraction in (0, 1) (default: 0.5)\n";
    std::cout << "  -m MODE    Overlap mode: counter, heater (default: counter)\n";
    std::cout << "  -t THREADS Number of threads (default: 4)\n";
    std::cout << "  -h, --help Show this help\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << prog << " -u tiling_par.txt -a meerkat.txt -n 400 -o 0.7\n";
}

int main(int argc, char* argv[]) {
    std::string param_file;
    mosaic::Config::Overrides overrides;

    static struct option long_options[] = {
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "u:a:n:r:o:m:t:h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'u':
                param_file = optarg;
                break;
            case 'a':
                overrides.emplace_back("ANTENNAS", optarg);
                break;
            case 'n':
                overrides.emplace_back("BEAM_NUM", optarg);
                break;
            case 'r':
                overrides.emplace_back("TILING_RADIUS", optarg);
                break;
            case 'o':
                overrides.emplace_back("OVERLAP", optarg);
                break;
            case 'm':
                overrides.emplace_back("OVERLAP_MODE", optarg);
                break;
            case 't':
                overrides.emplace_back("NUM_THREADS", optarg);
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (param_file.empty()) {
        std::cerr << "Error: -u option is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::cout << "========================================" << std::endl;
        std::cout << "  Multi-beam Tiling Planner" << std::endl;
        std::cout << "========================================" << std::endl;

        // 1. Load configuration
        std::cout << "\n[1] Loading configuration from " << param_file << std::endl;
        mosaic::Config config = mosaic::Config::fromFile(param_file, overrides);

        if (config.antenna_file.empty()) {
            std::cerr << "Error: no antenna file (ANTENNAS or -a)" << std::endl;
            return 1;
        }

        // 2. Load antennas
        std::cout << "\n[2] Loading antennas from " << config.antenna_file << std::endl;
        mosaic::AntennaGeometry geometry = mosaic::loadAntennaFile(config.antenna_file);
        std::vector<mosaic::AntennaInput> antennas(geometry.begin(), geometry.end());

        // 3. Beam shape
        std::cout << "\n[3] Simulating beam shape..." << std::endl;
        mosaic::PsfOptions psf_options;
        psf_options.image_density = config.image_density;
        psf_options.psf_oversampling = config.psf_oversampling;
        psf_options.num_threads = config.num_threads;

        mosaic::PsfSim psf_sim(antennas, config.frequencies, config.reference, psf_options);
        auto beam_shape = psf_sim.getBeamShape(config.bore_sight, config.observe_epoch);

        std::cout << "Beam axes: " << beam_shape->axisH() << " x " << beam_shape->axisV()
                  << " deg, angle " << beam_shape->angle() << " deg" << std::endl;
        std::cout << "Elevation: " << beam_shape->horizon().elevation << " deg" << std::endl;
        std::cout << "Primary beam radius: " << psf_sim.primaryBeamRadius() << " deg" << std::endl;

        // 4. Tiling
        std::cout << "\n[4] Generating tiling..." << std::endl;
        mosaic::EllipsePacker packer(config.num_threads);
        mosaic::Tiling tiling =
            (config.tiling_mode == mosaic::TilingMode::RADIUS)
                ? mosaic::generateRadiusTiling(beam_shape, config.tiling_radius,
                                               config.overlap, packer)
                : mosaic::generateNBeamsTiling(beam_shape, config.beam_num, config.overlap,
                                               packer, config.pack_precision);

        if (tiling.beamNum() == 0) {
            std::cerr << "Tiling radius holds no beams" << std::endl;
            return 1;
        }

        // 5. Overlap
        std::cout << "\n[5] Calculating overlap..." << std::endl;
        mosaic::OverlapOptions overlap_options;
        overlap_options.grid_size = config.overlap_grid;
        overlap_options.counter_threshold = config.counter_threshold;
        overlap_options.num_threads = config.num_threads;

        mosaic::Overlap overlap = tiling.calculateOverlap(config.overlap_mode, nullptr,
                                                          overlap_options);
        if (overlap.mode() == mosaic::OverlapMode::COUNTER) {
            auto fractions = overlap.calculateFractions();
            std::cout << "Overlapped: " << fractions.overlapped
                      << ", single: " << fractions.non_overlapped
                      << ", empty: " << fractions.empty << std::endl;
        }

        // 6. Delays
        std::cout << "\n[6] Calculating delays..." << std::endl;
        std::vector<mosaic::TargetInput> targets = tiling.delayTargets();

        mosaic::DelaySelectionPolicy policy;
        policy.polarizations = config.n_pol;
        policy.polarization_index = config.pol_index;
        policy.sample_index = config.sample_index;

        mosaic::DelayPolynomial delay_poly(antennas, targets, config.reference,
                                           config.delay_freq, policy);
        mosaic::DelayTable delays = delay_poly.getDelayPolynomials(config.observe_epoch,
                                                                   config.delay_duration);

        // 7. Outputs
        std::cout << "\n[7] Writing outputs..." << std::endl;
        bool ok = true;
        if (!config.tiling_out.empty()) {
            ok = mosaic::writeTilingFile(config.tiling_out, tiling) && ok;
        }
        if (!config.delay_out.empty()) {
            ok = mosaic::writeDelayTable(config.delay_out, delays, delay_poly.targets()) && ok;
        }
        if (!config.psf_fits.empty()) {
            ok = mosaic::writePsfFits(config.psf_fits, *beam_shape) && ok;
        }
        if (!config.overlap_fits.empty()) {
            ok = mosaic::writeOverlapFits(config.overlap_fits, overlap, beam_shape->boreSight()) && ok;
        }

        std::cout << "\n========================================" << std::endl;
        std::cout << "  Tiling Complete!" << std::endl;
        std::cout << "  Beams: " << tiling.beamNum() << ", radius: "
                  << tiling.tilingRadius() << " deg" << std::endl;
        std::cout << "========================================" << std::endl;

        return ok ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
