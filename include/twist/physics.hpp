/**
 * @file physics.hpp
 * @brief Core flux equations for TWIST
 *
 * Tree Water Imbalance and Storage Tracker (TWIST)
 * Based on Ziegler et al. (2025, in prep.), equations (1)-(5)
 *
 * Each function corresponds to one equation of the model. All of them are
 * pure: no state, no clamping of inputs, no checks on denominators. Division
 * degeneracies (F_theta == 0, rho_dry == 0, W == 0) produce inf/NaN which is
 * deliberately carried through the min/max limiters below.
 */

#pragma once

#include "config.hpp"
#include "state.hpp"

namespace twist {
namespace physics {

// ============================================================================
// SOIL WATER LIMITATION
// ============================================================================

/**
 * @brief Soil water limitation of uptake - equation (3)
 *
 *   f_soil = min(theta_rel / F_theta, 1)
 *
 * There is no lower bound: a negative theta_rel yields a negative factor.
 * The comparison is ordered so a NaN ratio is returned rather than 1.
 *
 * @param theta_rel Relative soil water content [-]
 * @param F_theta Soil moisture threshold above which uptake is unlimited
 * @return Limitation factor, at most 1
 */
inline Real soil_limitation(Real theta_rel, Real F_theta) {
    Real ratio = theta_rel / F_theta;
    return (Real(1) < ratio) ? Real(1) : ratio;
}

// ============================================================================
// WATER UPTAKE
// ============================================================================

/**
 * @brief Root water uptake - equation (2)
 *
 *   U = (F_E * E + F_TWD * TWD_old) * f_soil
 *
 * Dry soil suppresses both the transpiration-driven and the refill-driven
 * component by the same factor.
 */
inline Real compute_uptake(
    Real E, Real TWD_old, Real theta_rel, const Parameters& params
) {
    Real f_soil = soil_limitation(theta_rel, params.F_theta);
    return (params.F_E * E + params.F_TWD * TWD_old) * f_soil;
}

// ============================================================================
// TREE WATER DEFICIT
// ============================================================================

/**
 * @brief Tree water deficit update - equation (1)
 *
 *   TWD_new = TWD_old + E - U
 *
 * Unbounded in both directions; clamping happens only in compute_rwc.
 */
inline Real update_deficit(
    Real E, Real TWD_old, Real theta_rel, const Parameters& params
) {
    Real U = compute_uptake(E, TWD_old, theta_rel, params);
    return TWD_old + E - U;
}

// ============================================================================
// RELATIVE WATER CONTENT
// ============================================================================

/**
 * @brief Relative water content of the tree water pool - equation (4)
 *
 *   RWC = max(0, (W - TWD) / W)
 *
 * Floored at 0, not capped at 1: a negative TWD (over-recharge) gives
 * RWC > 1. NaN from W == 0 and TWD == 0 passes through.
 */
inline Real compute_rwc(Real W, Real TWD) {
    Real frac = (W - TWD) / W;
    return (frac < Real(0)) ? Real(0) : frac;
}

// ============================================================================
// WATER POOL
// ============================================================================

/**
 * @brief Tree water pool from wood biomass and densities - equation (5)
 *
 *   W = (rho_sat / rho_dry - 1) * m_wood_dry
 *
 * @param m_wood_dry Oven-dry wood biomass contributing to storage
 * @param pool Saturated and dry wood densities
 * @return Water pool in the mass unit of m_wood_dry
 */
inline Real compute_water_pool(Real m_wood_dry, const PoolParameters& pool) {
    return (pool.rho_sat / pool.rho_dry - Real(1)) * m_wood_dry;
}

} // namespace physics
} // namespace twist
