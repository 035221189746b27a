/**
 * @file kernels.hpp
 * @brief Timestep and sequence drivers for TWIST
 *
 * This file contains:
 * - twist_step: single timestep (the model core)
 * - twist_forward_cpu: one site over a forcing sequence
 * - twist_forward_batch_cpu: many independent sites
 *
 * The deficit is threaded explicitly: twist_step takes the previous state by
 * value and returns the next one, so a run is a left fold over its forcing.
 */

#pragma once

#include "config.hpp"
#include "state.hpp"
#include "physics.hpp"

#include <cstddef>
#include <vector>

namespace twist {

// ============================================================================
// SINGLE TIMESTEP
// ============================================================================

/**
 * @brief Execute a single timestep of the TWIST model
 *
 * Order of evaluation: soil limitation, uptake from the previous deficit,
 * deficit update, relative water content from the new deficit.
 *
 * @param state Deficit at the end of the previous timestep
 * @param forcing Transpiration, soil moisture and pool size for this timestep
 * @param params Deficit model parameters
 * @param[out] flux Fluxes and outputs of this timestep
 * @return Deficit at the end of this timestep
 */
inline State twist_step(
    State state,
    const Forcing& forcing,
    const Parameters& params,
    Flux& flux
) {
    using namespace physics;

    flux.f_soil = soil_limitation(forcing.theta_rel, params.F_theta);
    flux.uptake = compute_uptake(forcing.E, state.TWD, forcing.theta_rel, params);

    // Equation (1), same as update_deficit() with the uptake kept for output
    state.TWD = state.TWD + forcing.E - flux.uptake;

    flux.TWD = state.TWD;
    flux.RWC = compute_rwc(forcing.W, state.TWD);
    return state;
}

// ============================================================================
// CPU FORWARD FUNCTION
// ============================================================================

/**
 * @brief Run one site over a forcing sequence
 *
 * Strictly sequential: timestep t starts from the deficit emitted by t-1.
 *
 * @param initial_state Deficit at simulation start (0 = fully hydrated)
 * @param forcing Forcing sequence [n_timesteps]
 * @param params Deficit model parameters
 * @param n_timesteps Number of timesteps
 * @param fluxes Output fluxes [n_timesteps]
 * @return Final state
 */
inline State twist_forward_cpu(
    State initial_state,
    const Forcing* forcing,
    const Parameters& params,
    std::size_t n_timesteps,
    Flux* fluxes
) {
    State state = initial_state;
    for (std::size_t t = 0; t < n_timesteps; ++t) {
        state = twist_step(state, forcing[t], params, fluxes[t]);
    }
    return state;
}

inline std::vector<Flux> twist_forward_cpu(
    State initial_state,
    const std::vector<Forcing>& forcing,
    const Parameters& params
) {
    std::vector<Flux> fluxes(forcing.size());
    twist_forward_cpu(initial_state, forcing.data(), params,
                      forcing.size(), fluxes.data());
    return fluxes;
}

// ============================================================================
// BATCH OF INDEPENDENT SITES
// ============================================================================

/**
 * @brief Run many independent sites
 *
 * Each site owns its accumulator and reads only its own forcing and the
 * parameters, so sites are distributed across OpenMP threads when enabled.
 *
 * @param initial_states Initial deficit per site [n_sites]
 * @param forcing Forcing, time-major [n_timesteps x n_sites]
 * @param params Parameters [n_sites], or [1] if shared
 * @param n_sites Number of sites
 * @param n_timesteps Number of timesteps
 * @param fluxes Output fluxes, time-major [n_timesteps x n_sites]
 * @param final_states Final deficit per site [n_sites]
 */
inline void twist_forward_batch_cpu(
    const State* initial_states,
    const Forcing* forcing,
    const Parameters* params,
    bool shared_params,
    int n_sites,
    int n_timesteps,
    Flux* fluxes,
    State* final_states
) {
    #pragma omp parallel for
    for (int s = 0; s < n_sites; ++s) {
        const Parameters& site_params = shared_params ? params[0] : params[s];
        State state = initial_states[s];
        for (int t = 0; t < n_timesteps; ++t) {
            int idx = t * n_sites + s;
            state = twist_step(state, forcing[idx], site_params, fluxes[idx]);
        }
        final_states[s] = state;
    }
}

} // namespace twist
