#pragma once

#include "../GlobalDefinitions.hpp"

namespace SBE::Dynamics {
    /**
     * The state of a path with N k-points is a flat complex vector of size 4 N + 1:
     * (f_v, p_vc, p_cv, f_c) for every k-point, followed by the accumulated vector potential A.
     * The integrator advances A together with the density matrix.
     */
    using state_type = nd_complex_vector;

    enum Component : int { f_v = 0, p_vc = 1, p_cv = 2, f_c = 3 };
    constexpr int n_components = 4;

    inline Eigen::Index state_size(int n_k) noexcept {
        return n_components * static_cast<Eigen::Index>(n_k) + 1;
    }

    /// Periodic view onto a state vector, keyed by k-index
    template<class Vector>
    class BasicDensityMatrixView {
    public:
        explicit BasicDensityMatrixView(Vector& _data)
            : data(_data), n_k{ static_cast<int>((_data.size() - 1) / n_components) }
        {}

        inline decltype(auto) operator()(int k, Component c) const {
            return data(index(k, c));
        }
        inline decltype(auto) vector_potential() const {
            return data(data.size() - 1);
        }

        inline Eigen::Index index(int k, Component c) const noexcept {
            return n_components * static_cast<Eigen::Index>(k) + c;
        }
        inline int next(int k) const noexcept {
            return (k + 1) % n_k;
        }
        inline int previous(int k) const noexcept {
            return (k + n_k - 1) % n_k;
        }
        inline int size() const noexcept {
            return n_k;
        }
    private:
        Vector& data;
        const int n_k{};
    };

    using DensityMatrixView = BasicDensityMatrixView<state_type>;
    using ConstDensityMatrixView = BasicDensityMatrixView<const state_type>;

    /**
     * Valence band full, no coherences, conduction band occupied according to 
     * the Fermi-Dirac distribution (a step function below temperature_threshold).
     * 
     * @param conduction_energies E_c(k) along the path in a.u.
     */
    state_type initial_condition(const nd_vector& conduction_energies, h_float e_fermi, h_float temperature);

    /// Throws ConfigurationError unless the vector holds 4 N + 1 entries with N >= 1
    void check_state_layout(const state_type& state, int n_k);
}
