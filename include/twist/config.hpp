/**
 * @file config.hpp
 * @brief Precision, version and input configuration for TWIST
 *
 * Tree Water Imbalance and Storage Tracker (TWIST)
 *
 * Holds the compile-time choices (floating point precision, optional I/O
 * backends) and the column-name record that maps the four logical roles of a
 * timeseries table onto whatever the source table calls them.
 */

#pragma once

#include <string>

namespace twist {

// ============================================================================
// PRECISION
// ============================================================================

#ifdef TWIST_USE_FLOAT
using Real = float;
#else
using Real = double;
#endif

// ============================================================================
// VERSION
// ============================================================================

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

inline std::string version_string() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

#ifdef TWIST_USE_NETCDF
constexpr bool HAS_NETCDF = true;
#else
constexpr bool HAS_NETCDF = false;
#endif

// ============================================================================
// COLUMN CONFIGURATION
// ============================================================================

/**
 * @brief Mapping of logical input roles to table column names
 *
 * The role set is fixed, so this is a plain record rather than a lookup map.
 * All water quantities (E, W and the resulting TWD) must share one unit.
 */
struct ColumnNames {
    std::string time   = "datetime";       ///< Timestamp column
    std::string E      = "transpiration";  ///< Transpirational water loss per timestep
    std::string theta  = "theta_rel";      ///< Relative soil water content [-]
    std::string m_wood = "m_dry_wood";     ///< Oven-dry wood biomass (pool estimation only)
    std::string W      = "W";              ///< Tree water pool size
};

} // namespace twist
