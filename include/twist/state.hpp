/**
 * @file state.hpp
 * @brief Parameters, forcing, state and flux records for TWIST
 */

#pragma once

#include "config.hpp"
#include <string>
#include <vector>

namespace twist {

constexpr int NUM_PARAMETERS = 3;       // F_E, F_TWD, F_theta
constexpr int NUM_FORCING = 3;          // E, theta_rel, W
constexpr int NUM_FLUXES = 4;           // f_soil, uptake, TWD, RWC

// ============================================================================
// PARAMETERS
// ============================================================================

/**
 * @brief Deficit model parameters
 *
 * Supplied once per run and shared read-only by every timestep. Values are
 * not validated on construction: out-of-range fractions and F_theta == 0
 * propagate arithmetically through the model. Use check_ranges() to report
 * suspicious values.
 */
struct Parameters {
    Real F_E = Real(0.6);       ///< Fraction of transpiration directly met by uptake [0, 1]
    Real F_TWD = Real(0.3);     ///< Fraction of standing TWD refillable per timestep [0, 1]
    Real F_theta = Real(0.7);   ///< Soil moisture threshold for uptake downregulation (> 0)

    Parameters() = default;
    Parameters(Real f_e, Real f_twd, Real f_theta)
        : F_E(f_e), F_TWD(f_twd), F_theta(f_theta) {}

    void to_array(Real* arr) const {
        arr[0] = F_E;
        arr[1] = F_TWD;
        arr[2] = F_theta;
    }

    void from_array(const Real* arr) {
        F_E = arr[0];
        F_TWD = arr[1];
        F_theta = arr[2];
    }

    /**
     * @brief List values outside their nominal ranges
     * @return One message per offending parameter, empty if all nominal
     */
    std::vector<std::string> check_ranges() const {
        std::vector<std::string> warnings;
        if (!(F_E >= Real(0) && F_E <= Real(1))) {
            warnings.push_back("F_E = " + std::to_string(F_E) + " outside [0, 1]");
        }
        if (!(F_TWD >= Real(0) && F_TWD <= Real(1))) {
            warnings.push_back("F_TWD = " + std::to_string(F_TWD) + " outside [0, 1]");
        }
        if (!(F_theta > Real(0))) {
            warnings.push_back("F_theta = " + std::to_string(F_theta) +
                               " is not positive (soil limitation divides by it)");
        }
        return warnings;
    }
};

/**
 * @brief Wood density parameters for tree water pool estimation
 *
 * rho_sat > rho_dry is assumed; otherwise the pool is non-positive.
 */
struct PoolParameters {
    Real rho_sat = Real(1.07);  ///< Fully saturated wood density [kg dm-3]
    Real rho_dry = Real(0.58);  ///< Oven-dry wood density [kg dm-3]

    PoolParameters() = default;
    PoolParameters(Real sat, Real dry) : rho_sat(sat), rho_dry(dry) {}

    std::vector<std::string> check_ranges() const {
        std::vector<std::string> warnings;
        if (!(rho_dry > Real(0))) {
            warnings.push_back("rho_dry = " + std::to_string(rho_dry) + " is not positive");
        }
        if (!(rho_sat > rho_dry)) {
            warnings.push_back("rho_sat <= rho_dry gives a non-positive water pool");
        }
        return warnings;
    }
};

// ============================================================================
// FORCING
// ============================================================================

/**
 * @brief Per-timestep model input
 *
 * W must already be attached (see compute_water_pool) and should be > 0.
 */
struct Forcing {
    Real E = Real(0);          ///< Transpiration during the timestep
    Real theta_rel = Real(1);  ///< Relative soil water content (0 wilting point, 1 field capacity)
    Real W = Real(0);          ///< Tree water pool size

    Forcing() = default;
    Forcing(Real e, Real theta, Real w) : E(e), theta_rel(theta), W(w) {}
};

// ============================================================================
// STATE
// ============================================================================

/**
 * @brief Model state: the tree water deficit
 *
 * Owned by a single run. TWD = 0 is full hydration.
 */
struct State {
    Real TWD = Real(0);

    State() = default;
    explicit State(Real twd) : TWD(twd) {}
};

// ============================================================================
// FLUXES
// ============================================================================

/**
 * @brief Quantities computed during one timestep
 */
struct Flux {
    Real f_soil = Real(0);  ///< Soil limitation factor [-]
    Real uptake = Real(0);  ///< Root water uptake (same unit as E)
    Real TWD = Real(0);     ///< Deficit after the step
    Real RWC = Real(0);     ///< Relative water content after the step [-], floored at 0

    void to_array(Real* arr) const {
        arr[0] = f_soil;
        arr[1] = uptake;
        arr[2] = TWD;
        arr[3] = RWC;
    }
};

} // namespace twist
