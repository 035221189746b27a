/**
 * @file twist_cli.cpp
 * @brief TWIST Command Line Interface
 *
 * Usage:
 *   twist <controlFile>
 *
 * Arguments:
 *   controlFile: Path to TWIST control file (input/output paths, column
 *                names, model and water pool parameters)
 *
 * Workflow: read input table, estimate the water pool from wood biomass if
 * the biomass column is present, run the model, write TWD and RWC.
 */

#include "twist/twist.hpp"
#include "twist/control.hpp"
#include "twist/io.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace twist;

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <controlFile>\n";
    std::cerr << "\n";
    std::cerr << "Arguments:\n";
    std::cerr << "  controlFile  Path to TWIST control file\n";
    std::cerr << "\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << prog << " stitna_fagus.ctl\n";
}

void print_warnings(const std::vector<std::string>& warnings) {
    for (const auto& w : warnings) {
        std::cerr << "  Warning: " << w << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string control_path = argv[1];

    try {
        std::cout << "TWIST v" << version_string() << "\n";
        std::cout << std::string(60, '=') << "\n";

        // Parse control file
        std::cout << "Parsing control file...\n";
        ControlFile ctl = parse_control_file(control_path);
        for (const auto& key : ctl.unknown_keys) {
            std::cerr << "  Warning: unknown key '" << key << "' ignored\n";
        }

        std::cout << "  Input: " << ctl.input_file << "\n";
        std::cout << "  Output: " << ctl.output_file << "\n";

        std::cout << "\nModel parameters:\n";
        std::cout << "  F_E: " << ctl.params.F_E << "\n";
        std::cout << "  F_TWD: " << ctl.params.F_TWD << "\n";
        std::cout << "  F_theta: " << ctl.params.F_theta << "\n";
        std::cout << "  TWD_init: " << ctl.TWD_init << "\n";
        print_warnings(ctl.params.check_ranges());

        // Load input
        std::cout << "\nLoading input data...\n";
        TimeseriesTable table = io::read_timeseries(ctl.input_file, ctl.columns.time);
        std::cout << "  Timesteps: " << table.num_rows() << "\n";
        std::cout << "  Columns: " << table.num_columns() << "\n";

        // Water pool
        if (table.has_column(ctl.columns.m_wood)) {
            std::cout << "\nEstimating water pool from '" << ctl.columns.m_wood << "'...\n";
            std::cout << "  rho_sat: " << ctl.pool.rho_sat << " kg/dm3\n";
            std::cout << "  rho_dry: " << ctl.pool.rho_dry << " kg/dm3\n";
            print_warnings(ctl.pool.check_ranges());
            attach_water_pool(table, ctl.pool, ctl.columns);
        } else {
            std::cout << "\nUsing water pool column '" << ctl.columns.W << "'\n";
        }

        // Run model
        std::cout << "\nRunning TWIST...\n";
        auto start_time = std::chrono::high_resolution_clock::now();

        OutputTable output = run_timeseries(table, ctl.params, ctl.TWD_init, ctl.columns);

        auto end_time = std::chrono::high_resolution_clock::now();
        double elapsed = std::chrono::duration<double>(end_time - start_time).count();
        std::cout << "  Completed in " << elapsed << " seconds\n";

        // Summary statistics over finite values
        // TWD may be negative and RWC above 1 after over-recharge
        Real twd_mean = 0;
        Real twd_max = -std::numeric_limits<Real>::infinity();
        Real rwc_min = std::numeric_limits<Real>::infinity();
        size_t n_finite = 0;
        for (size_t i = 0; i < output.size(); ++i) {
            if (!std::isfinite(output.TWD[i]) || !std::isfinite(output.RWC[i])) continue;
            twd_mean += output.TWD[i];
            twd_max = std::max(twd_max, output.TWD[i]);
            rwc_min = std::min(rwc_min, output.RWC[i]);
            n_finite++;
        }
        if (n_finite > 0) {
            twd_mean /= n_finite;
            std::cout << "  TWD: mean=" << twd_mean << ", max=" << twd_max << "\n";
            std::cout << "  RWC: min=" << rwc_min << "\n";
        }

        size_t n_bad = count_non_finite(output);
        if (n_bad > 0) {
            std::cerr << "  Warning: " << n_bad << " timestep(s) with non-finite TWD or RWC"
                      << " (check F_theta and W for zeros)\n";
        }

        // Write output
        io::write_output(ctl.output_file, output, ctl.write_fluxes);
        std::cout << "\nOutput saved: " << ctl.output_file << "\n";

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "TWIST completed successfully\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
