/**
 * @file twist.hpp
 * @brief Main include for TWIST
 *
 * Tree Water Imbalance and Storage Tracker (TWIST)
 * Based on Ziegler et al. (2025, in prep.)
 *
 * Tracks the tree water deficit (TWD) of a single tree or stand from
 * transpiration and relative soil moisture, and the resulting relative water
 * content (RWC) of the tree water pool.
 */

#pragma once

#include "config.hpp"
#include "state.hpp"
#include "physics.hpp"
#include "kernels.hpp"
#include "timeseries.hpp"

#include <cstdio>

namespace twist {

/**
 * @brief Print build information
 */
inline void print_info() {
    printf("TWIST v%s\n", version_string().c_str());
    printf("  Precision: %s\n", sizeof(Real) == sizeof(double) ? "double" : "float");
    printf("  NetCDF: %s\n", HAS_NETCDF ? "enabled" : "disabled");
#ifdef _OPENMP
    printf("  OpenMP: enabled\n");
#else
    printf("  OpenMP: disabled\n");
#endif
}

} // namespace twist
