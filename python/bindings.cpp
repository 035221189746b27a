/**
 * @file bindings.cpp
 * @brief Python bindings for TWIST via pybind11
 */

 #include <pybind11/pybind11.h>
 #include <pybind11/numpy.h>
 #include <pybind11/stl.h>

 #include "twist/twist.hpp"

 #include <vector>
 #include <stdexcept>
 #include <string>

 namespace py = pybind11;
 using namespace twist;

 // Helpers
 Parameters params_from_numpy(py::array_t<Real> arr) {
     auto buf = arr.unchecked<1>();
     if (buf.shape(0) != NUM_PARAMETERS) {
         throw std::runtime_error("Expected " + std::to_string(NUM_PARAMETERS) +
                                  " parameters [F_E, F_TWD, F_theta], got " +
                                  std::to_string(buf.shape(0)));
     }
     Real param_arr[NUM_PARAMETERS];
     for (ssize_t i = 0; i < NUM_PARAMETERS; ++i) param_arr[i] = buf(i);
     Parameters params;
     params.from_array(param_arr);
     return params;
 }

 py::array_t<Real> fluxes_to_numpy(const std::vector<Flux>& fluxes) {
     int n = static_cast<int>(fluxes.size());
     auto out = py::array_t<Real>({n, NUM_FLUXES});
     auto buf = out.mutable_unchecked<2>();
     Real arr[NUM_FLUXES];
     for (int t = 0; t < n; ++t) {
         fluxes[t].to_array(arr);
         for (int k = 0; k < NUM_FLUXES; ++k) buf(t, k) = arr[k];
     }
     return out;
 }

 // Forward Runner
 // forcing columns: E, theta_rel, W
 py::tuple run_twist_cpu(
     py::array_t<Real> forcing,
     py::array_t<Real> params,
     Real twd_init,
     bool return_fluxes = false
 ) {
     auto forcing_buf = forcing.unchecked<2>();
     if (forcing_buf.shape(1) != NUM_FORCING) {
         throw std::runtime_error("forcing must have shape (n_timesteps, 3): E, theta_rel, W");
     }
     int n_timesteps = static_cast<int>(forcing_buf.shape(0));
     Parameters parameters = params_from_numpy(params);

     std::vector<Forcing> f(n_timesteps);
     for (int t = 0; t < n_timesteps; ++t) {
         f[t] = Forcing(forcing_buf(t, 0), forcing_buf(t, 1), forcing_buf(t, 2));
     }

     std::vector<Flux> fluxes(n_timesteps);
     State final_state = twist_forward_cpu(State(twd_init), f.data(), parameters,
                                           f.size(), fluxes.data());

     auto twd = py::array_t<Real>(n_timesteps);
     auto rwc = py::array_t<Real>(n_timesteps);
     auto twd_buf = twd.mutable_unchecked<1>();
     auto rwc_buf = rwc.mutable_unchecked<1>();
     for (int t = 0; t < n_timesteps; ++t) {
         twd_buf(t) = fluxes[t].TWD;
         rwc_buf(t) = fluxes[t].RWC;
     }

     if (return_fluxes) {
         return py::make_tuple(final_state.TWD, twd, rwc, fluxes_to_numpy(fluxes));
     }
     return py::make_tuple(final_state.TWD, twd, rwc);
 }

 // Batch Runner
 // forcing: (n_timesteps, n_sites, 3); params: (3,) shared or (n_sites, 3)
 py::tuple run_twist_batch_cpu(
     py::array_t<Real> twd_init,
     py::array_t<Real> forcing,
     py::array_t<Real> params
 ) {
     auto init_buf = twd_init.unchecked<1>();
     auto forcing_buf = forcing.unchecked<3>();
     int n_sites = static_cast<int>(init_buf.shape(0));
     int n_timesteps = static_cast<int>(forcing_buf.shape(0));
     if (forcing_buf.shape(1) != n_sites || forcing_buf.shape(2) != NUM_FORCING) {
         throw std::runtime_error("forcing must have shape (n_timesteps, n_sites, 3)");
     }
     bool shared_params = (params.ndim() == 1);

     std::vector<State> states_in(n_sites);
     for (int s = 0; s < n_sites; ++s) states_in[s] = State(init_buf(s));

     std::vector<Parameters> site_params;
     if (shared_params) {
         site_params.push_back(params_from_numpy(params));
     } else {
         auto p_buf = params.unchecked<2>();
         if (p_buf.shape(0) != n_sites || p_buf.shape(1) != NUM_PARAMETERS) {
             throw std::runtime_error("params must have shape (3,) or (n_sites, 3)");
         }
         site_params.resize(n_sites);
         for (int s = 0; s < n_sites; ++s) {
             site_params[s] = Parameters(p_buf(s, 0), p_buf(s, 1), p_buf(s, 2));
         }
     }

     std::vector<Forcing> f(static_cast<size_t>(n_timesteps) * n_sites);
     for (int t = 0; t < n_timesteps; ++t) {
         for (int s = 0; s < n_sites; ++s) {
             f[t * n_sites + s] = Forcing(forcing_buf(t, s, 0), forcing_buf(t, s, 1),
                                          forcing_buf(t, s, 2));
         }
     }

     std::vector<Flux> fluxes(f.size());
     std::vector<State> states_out(n_sites);
     twist_forward_batch_cpu(states_in.data(), f.data(), site_params.data(), shared_params,
                             n_sites, n_timesteps, fluxes.data(), states_out.data());

     auto final_twd = py::array_t<Real>(n_sites);
     auto twd = py::array_t<Real>({n_timesteps, n_sites});
     auto rwc = py::array_t<Real>({n_timesteps, n_sites});
     auto final_buf = final_twd.mutable_unchecked<1>();
     auto twd_buf = twd.mutable_unchecked<2>();
     auto rwc_buf = rwc.mutable_unchecked<2>();
     for (int s = 0; s < n_sites; ++s) final_buf(s) = states_out[s].TWD;
     for (int t = 0; t < n_timesteps; ++t) {
         for (int s = 0; s < n_sites; ++s) {
             twd_buf(t, s) = fluxes[t * n_sites + s].TWD;
             rwc_buf(t, s) = fluxes[t * n_sites + s].RWC;
         }
     }
     return py::make_tuple(final_twd, twd, rwc);
 }

 // Module
 PYBIND11_MODULE(twist_core, m) {
     m.doc() = "TWIST C++ backend";
     m.attr("NUM_PARAMETERS") = NUM_PARAMETERS;
     m.attr("NUM_FORCING") = NUM_FORCING;
     m.attr("NUM_FLUXES") = NUM_FLUXES;
     m.attr("__version__") = version_string();

     m.def("run_twist", &run_twist_cpu, py::arg("forcing"), py::arg("params"), py::arg("twd_init")=0.0, py::arg("return_fluxes")=false);
     m.def("run_twist_batch", &run_twist_batch_cpu, py::arg("twd_init"), py::arg("forcing"), py::arg("params"));

     m.def("default_params", []() {
         Real arr[NUM_PARAMETERS];
         Parameters().to_array(arr);
         auto out = py::array_t<Real>(NUM_PARAMETERS);
         auto buf = out.mutable_unchecked<1>();
         for (int i = 0; i < NUM_PARAMETERS; ++i) buf(i) = arr[i];
         return out;
     }, "Default parameters [F_E, F_TWD, F_theta]");

     m.def("soil_limitation", &physics::soil_limitation, py::arg("theta_rel"), py::arg("F_theta"));

     m.def("compute_water_pool", [](py::array_t<Real> m_wood, Real rho_sat, Real rho_dry) {
         auto m_buf = m_wood.unchecked<1>();
         int n = static_cast<int>(m_buf.shape(0));
         PoolParameters pool(rho_sat, rho_dry);
         auto out = py::array_t<Real>(n);
         auto out_buf = out.mutable_unchecked<1>();
         for (int i = 0; i < n; ++i) out_buf(i) = physics::compute_water_pool(m_buf(i), pool);
         return out;
     }, py::arg("m_wood_dry"), py::arg("rho_sat"), py::arg("rho_dry"));

     m.attr("HAS_NETCDF") = HAS_NETCDF;
 }
