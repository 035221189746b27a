/**
 * @file test_cpu.cpp
 * @brief Basic CPU tests for TWIST
 */

#include <twist/twist.hpp>
#include <cstdio>
#include <cmath>
#include <cassert>
#include <vector>

using namespace twist;

static bool approx(Real a, Real b, Real tol = Real(1e-9)) {
    return std::abs(a - b) <= tol;
}

/**
 * @brief Test soil limitation factor
 */
void test_soil_limitation() {
    printf("Testing soil limitation... ");

    using namespace physics;

    // At or above the threshold: exactly 1
    assert(soil_limitation(0.7, 0.7) == 1.0);
    assert(soil_limitation(1.0, 0.7) == 1.0);
    assert(soil_limitation(2.5, 0.3) == 1.0);

    // Below the threshold: plain ratio, no lower clamp
    assert(soil_limitation(0.35, 0.7) == 0.35 / 0.7);
    assert(soil_limitation(0.0, 0.7) == 0.0);
    assert(soil_limitation(-0.1, 0.5) == -0.1 / 0.5);
    assert(soil_limitation(-0.1, 0.5) < 0.0);

    // F_theta == 0: 0/0 must not turn into 1
    assert(std::isnan(soil_limitation(0.0, 0.0)));

    printf("PASSED\n");
}

/**
 * @brief Test uptake and deficit update, equations (1) and (2)
 */
void test_uptake_and_deficit() {
    printf("Testing uptake and deficit update... ");

    using namespace physics;
    Parameters params(0.6, 0.3, 0.7);

    // Wet soil, no standing deficit
    Real U = compute_uptake(10.0, 0.0, 1.0, params);
    assert(approx(U, 6.0));
    assert(approx(update_deficit(10.0, 0.0, 1.0, params), 4.0));

    // Half-limited soil, refill only
    U = compute_uptake(0.0, 4.0, 0.35, params);
    assert(approx(U, 0.6));
    assert(approx(update_deficit(0.0, 4.0, 0.35, params), 3.4));

    // Dry soil: no uptake at all, deficit grows by E
    assert(compute_uptake(5.0, 3.0, 0.0, params) == 0.0);
    assert(approx(update_deficit(5.0, 3.0, 0.0, params), 8.0));

    // Deficit may go negative (over-recharge), it is not floored
    Parameters strong(1.0, 2.0, 0.5);
    Real twd = update_deficit(0.0, 1.0, 1.0, strong);
    assert(approx(twd, -1.0));

    // Array layout used by the Python module: F_E, F_TWD, F_theta
    Real arr[NUM_PARAMETERS];
    params.to_array(arr);
    assert(arr[0] == params.F_E && arr[1] == params.F_TWD && arr[2] == params.F_theta);
    Parameters copy;
    copy.from_array(arr);
    assert(approx(compute_uptake(10.0, 2.0, 0.35, copy), compute_uptake(10.0, 2.0, 0.35, params)));

    // Uptake grows with F_TWD when there is a standing deficit
    Real prev = compute_uptake(2.0, 5.0, 0.5, Parameters(0.6, 0.0, 0.7));
    for (int i = 1; i <= 10; ++i) {
        Real u = compute_uptake(2.0, 5.0, 0.5, Parameters(0.6, 0.1 * i, 0.7));
        assert(u >= prev);
        prev = u;
    }

    printf("PASSED\n");
}

/**
 * @brief Test relative water content, equation (4)
 */
void test_relative_water_content() {
    printf("Testing relative water content... ");

    using namespace physics;

    assert(compute_rwc(100.0, 0.0) == 1.0);
    assert(compute_rwc(100.0, 100.0) == 0.0);
    assert(compute_rwc(100.0, 250.0) == 0.0);
    assert(approx(compute_rwc(100.0, 4.0), 0.96));

    // No ceiling: over-recharged pool exceeds 1
    assert(approx(compute_rwc(100.0, -50.0), 1.5));

    // W == 0 with no deficit is 0/0 and must stay NaN
    assert(std::isnan(compute_rwc(0.0, 0.0)));

    printf("PASSED\n");
}

/**
 * @brief Test water pool estimation, equation (5)
 */
void test_water_pool() {
    printf("Testing water pool... ");

    PoolParameters pool(1.07, 0.58);
    Real W = physics::compute_water_pool(50.0, pool);
    assert(approx(W, (1.07 / 0.58 - 1.0) * 50.0));
    assert(std::abs(W - 42.24) < 0.01);

    // Degenerate densities are not rejected
    assert(physics::compute_water_pool(50.0, PoolParameters(0.5, 0.5)) == 0.0);
    assert(physics::compute_water_pool(50.0, PoolParameters(0.4, 0.5)) < 0.0);
    assert(std::isinf(physics::compute_water_pool(50.0, PoolParameters(1.0, 0.0))));

    printf("PASSED\n");
    printf("  W: %.4f\n", W);
}

/**
 * @brief Test single timestep and state threading
 */
void test_single_step() {
    printf("Testing single step... ");

    Parameters params(0.6, 0.3, 0.7);
    Flux flux;

    // Seed: nothing happens on a wet, still timestep
    State s = twist_step(State(0.0), Forcing(0.0, 1.0, 100.0), params, flux);
    assert(s.TWD == 0.0);
    assert(flux.TWD == 0.0);
    assert(flux.RWC == 1.0);

    // Two-step sequence
    s = twist_step(State(0.0), Forcing(10.0, 1.0, 100.0), params, flux);
    assert(approx(flux.f_soil, 1.0));
    assert(approx(flux.uptake, 6.0));
    assert(approx(s.TWD, 4.0));
    assert(approx(flux.RWC, 0.96));

    s = twist_step(s, Forcing(0.0, 0.35, 100.0), params, flux);
    assert(approx(flux.f_soil, 0.5));
    assert(approx(flux.uptake, 0.6));
    assert(approx(s.TWD, 3.4));
    assert(approx(flux.RWC, 0.966));

    printf("PASSED\n");
}

/**
 * @brief Test a drydown followed by rewetting
 */
void test_time_series() {
    printf("Testing time series simulation... ");

    Parameters params(0.6, 0.3, 0.7);
    const int n_hours = 24 * 60;
    std::vector<Forcing> forcing(n_hours);

    // 40 days of drying soil with a diurnal transpiration cycle, then rewetting
    for (int h = 0; h < n_hours; ++h) {
        Real hour = h % 24;
        Real E = (hour >= 6 && hour <= 18) ? 0.2 * std::sin(M_PI * (hour - 6) / 12.0) : 0.0;
        Real theta = (h < 40 * 24) ? 1.0 - 0.9 * h / (40.0 * 24) : 1.0;
        forcing[h] = Forcing(E, theta, 30.0);
    }

    std::vector<Flux> fluxes = twist_forward_cpu(State(0.0), forcing, params);
    assert(static_cast<int>(fluxes.size()) == n_hours);

    Real twd_dry = fluxes[40 * 24 - 1].TWD;
    Real twd_end = fluxes[n_hours - 1].TWD;

    // Deficit builds during the drydown and recovers after rewetting
    assert(twd_dry > fluxes[10 * 24].TWD);
    assert(twd_end < twd_dry);
    for (const Flux& f : fluxes) {
        assert(f.RWC >= 0.0);
        assert(std::isfinite(f.TWD));
    }

    printf("PASSED\n");
    printf("  TWD at end of drydown: %.3f\n", twd_dry);
    printf("  TWD after rewetting: %.3f\n", twd_end);
    printf("  Minimum RWC: %.3f\n", fluxes[40 * 24 - 1].RWC);
}

/**
 * @brief Batch of sites must match independent single-site runs
 */
void test_batch_matches_single() {
    printf("Testing batch runner... ");

    const int n_sites = 4;
    const int n_timesteps = 50;

    std::vector<Parameters> params = {
        Parameters(0.6, 0.3, 0.7), Parameters(0.5, 0.1, 0.4),
        Parameters(0.8, 0.5, 0.9), Parameters(0.2, 0.2, 0.2)
    };
    std::vector<State> init = {State(0.0), State(1.0), State(2.5), State(0.0)};

    std::vector<Forcing> forcing(n_timesteps * n_sites);
    for (int t = 0; t < n_timesteps; ++t) {
        for (int s = 0; s < n_sites; ++s) {
            Real E = 0.1 * ((t + s) % 7);
            Real theta = 0.2 + 0.15 * ((t * 3 + s) % 5);
            forcing[t * n_sites + s] = Forcing(E, theta, 20.0 + s);
        }
    }

    std::vector<Flux> fluxes(forcing.size());
    std::vector<State> final_states(n_sites);
    twist_forward_batch_cpu(init.data(), forcing.data(), params.data(), false,
                            n_sites, n_timesteps, fluxes.data(), final_states.data());

    for (int s = 0; s < n_sites; ++s) {
        std::vector<Forcing> site_forcing(n_timesteps);
        for (int t = 0; t < n_timesteps; ++t) site_forcing[t] = forcing[t * n_sites + s];
        std::vector<Flux> single = twist_forward_cpu(init[s], site_forcing, params[s]);

        for (int t = 0; t < n_timesteps; ++t) {
            assert(single[t].TWD == fluxes[t * n_sites + s].TWD);
            assert(single[t].RWC == fluxes[t * n_sites + s].RWC);
        }
        assert(final_states[s].TWD == single[n_timesteps - 1].TWD);
    }

    printf("PASSED\n");
}

int main() {
    printf("\n");
    printf("========================================\n");
    printf("TWIST CPU Tests\n");
    printf("========================================\n");
    twist::print_info();
    printf("========================================\n\n");

    test_soil_limitation();
    test_uptake_and_deficit();
    test_relative_water_content();
    test_water_pool();
    test_single_step();
    test_time_series();
    test_batch_matches_single();

    printf("\n========================================\n");
    printf("All tests PASSED!\n");
    printf("========================================\n\n");

    return 0;
}
