#pragma once

#include "BandModel.hpp"

namespace SBE::Systems {
    /**
     * H(k) = h_0(k) 1 + d(k) . sigma
     * The bands are E_{v,c} = h_0 -+ |d|.
     * Derived classes only supply h_0, d and their gradients at a single point.
     */
    class TwoBandSystem : public BandModel {
    public:
        struct Coefficients {
            h_float h0{};
            real_vector<3> d{ real_vector<3>::Zero() };
            real_vector<2> grad_h0{ real_vector<2>::Zero() };
            real_matrix<3, 2> grad_d{ real_matrix<3, 2>::Zero() }; ///< grad_d(i, j) = d d_i / d k_j
        };

        BandEnergies energies(const nd_vector& kx, const nd_vector& ky) const final;
        EnergyDerivatives energy_derivatives(const nd_vector& kx, const nd_vector& ky) const final;
        DipoleElements dipoles(const nd_vector& kx, const nd_vector& ky) const final;
        HamiltonianDerivative hamiltonian_derivative(const nd_vector& kx, const nd_vector& ky) const final;
        band_matrix_array eigenvectors(const nd_vector& kx, const nd_vector& ky) const final;

        band_matrix hamiltonian(h_float kx, h_float ky) const;

        virtual Coefficients coefficients(h_float kx, h_float ky) const = 0;

        static band_matrix pauli_combination(const real_vector<3>& v);
    protected:
        /// Throws NumericalDomainError if any of the coefficients is not finite
        Coefficients checked_coefficients(h_float kx, h_float ky) const;
    };
}
