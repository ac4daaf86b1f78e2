#include "DensityMatrix.hpp"
#include "../Errors.hpp"

namespace SBE::Dynamics {
    state_type initial_condition(const nd_vector& conduction_energies, h_float e_fermi, h_float temperature)
    {
        const int n_k = static_cast<int>(conduction_energies.size());
        if (n_k < 1) {
            throw ConfigurationError("Cannot construct the initial condition of a path without k-points");
        }
        state_type state = state_type::Zero(state_size(n_k));
        DensityMatrixView rho(state);
        for (int k = 0; k < n_k; ++k) {
            rho(k, f_v) = 1.;
            rho(k, f_c) = fermi_function(conduction_energies(k) - e_fermi, temperature);
        }
        return state;
    }

    void check_state_layout(const state_type& state, int n_k)
    {
        if (n_k < 1 || state.size() != state_size(n_k)) {
            throw ConfigurationError("State vector of size " + std::to_string(state.size()) 
                + " does not match a path with " + std::to_string(n_k) + " k-points");
        }
    }
}
