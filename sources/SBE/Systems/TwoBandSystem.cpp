#include "TwoBandSystem.hpp"
#include "../Errors.hpp"

namespace SBE::Systems {
    namespace {
        void check_sizes(const nd_vector& kx, const nd_vector& ky) 
        {
            if (kx.size() != ky.size()) {
                throw ConfigurationError("Mismatched point arrays: kx has " + std::to_string(kx.size()) 
                    + " entries, ky has " + std::to_string(ky.size()));
            }
        }

        template<class Matrix>
        void check_finite(const Matrix& values, h_float kx, h_float ky, const char* what) 
        {
            if (!values.allFinite()) {
                throw NumericalDomainError(std::string("Band model produced a non-finite ") + what, kx, ky);
            }
        }

        // Eigenvector gauge: u_c = (e + d_z, d_x + i d_y) / N,  u_v = (-(d_x - i d_y), e + d_z) / N
        // with N = sqrt(2 e (e + d_z)); singular only at d = 0 and on the negative d_z axis
        band_matrix eigenvector_matrix(const real_vector<3>& d) 
        {
            const h_float e = d.norm();
            const h_float normalization = std::sqrt(2. * e * (e + d(2)));
            band_matrix U;
            U(0, 0) = -h_complex{ d(0), -d(1) } / normalization;
            U(1, 0) = (e + d(2)) / normalization;
            U(0, 1) = (e + d(2)) / normalization;
            U(1, 1) = h_complex{ d(0), d(1) } / normalization;
            return U;
        }
    }

    band_matrix TwoBandSystem::pauli_combination(const real_vector<3>& v)
    {
        band_matrix ret;
        ret << v(2), h_complex{ v(0), -v(1) },
            h_complex{ v(0), v(1) }, -v(2);
        return ret;
    }

    TwoBandSystem::Coefficients TwoBandSystem::checked_coefficients(h_float kx, h_float ky) const
    {
        const Coefficients c = coefficients(kx, ky);
        if (!std::isfinite(c.h0) || !c.d.allFinite() || !c.grad_h0.allFinite() || !c.grad_d.allFinite()) {
            throw NumericalDomainError("Hamiltonian coefficients are not finite", kx, ky);
        }
        return c;
    }

    band_matrix TwoBandSystem::hamiltonian(h_float kx, h_float ky) const
    {
        const Coefficients c = checked_coefficients(kx, ky);
        return c.h0 * band_matrix::Identity() + pauli_combination(c.d);
    }

    BandEnergies TwoBandSystem::energies(const nd_vector& kx, const nd_vector& ky) const
    {
        check_sizes(kx, ky);
        BandEnergies ret{ nd_vector(kx.size()), nd_vector(kx.size()) };
        for (Eigen::Index i = 0; i < kx.size(); ++i) {
            const Coefficients c = checked_coefficients(kx(i), ky(i));
            const h_float e = c.d.norm();
            ret.valence(i) = c.h0 - e;
            ret.conduction(i) = c.h0 + e;
        }
        return ret;
    }

    EnergyDerivatives TwoBandSystem::energy_derivatives(const nd_vector& kx, const nd_vector& ky) const
    {
        check_sizes(kx, ky);
        EnergyDerivatives ret{ nd_vector(kx.size()), nd_vector(kx.size()), nd_vector(kx.size()), nd_vector(kx.size()) };
        for (Eigen::Index i = 0; i < kx.size(); ++i) {
            const Coefficients c = checked_coefficients(kx(i), ky(i));
            // grad |d| = (d . grad d) / |d|
            const real_vector<2> grad_e = (c.d.transpose() * c.grad_d).transpose() / c.d.norm();
            check_finite(grad_e, kx(i), ky(i), "energy derivative");

            ret.valence_x(i) = c.grad_h0(0) - grad_e(0);
            ret.valence_y(i) = c.grad_h0(1) - grad_e(1);
            ret.conduction_x(i) = c.grad_h0(0) + grad_e(0);
            ret.conduction_y(i) = c.grad_h0(1) + grad_e(1);
        }
        return ret;
    }

    DipoleElements TwoBandSystem::dipoles(const nd_vector& kx, const nd_vector& ky) const
    {
        check_sizes(kx, ky);
        const Eigen::Index N = kx.size();
        DipoleElements ret{ nd_complex_vector(N), nd_complex_vector(N), nd_complex_vector(N),
            nd_complex_vector(N), nd_complex_vector(N), nd_complex_vector(N) };

        for (Eigen::Index i = 0; i < N; ++i) {
            const Coefficients c = checked_coefficients(kx(i), ky(i));
            const h_float e = c.d.norm();
            const band_matrix U = eigenvector_matrix(c.d);
            check_finite(U, kx(i), ky(i), "eigenvector");

            complex_vector<2> d_vv, d_vc, d_cc;
            for (int j = 0; j < 2; ++j) {
                const real_vector<3> grad = c.grad_d.col(j);
                // Berry connections of the chosen gauge
                const h_float berry = (c.d(0) * grad(1) - c.d(1) * grad(0)) / (2. * e * (e + c.d(2)));
                d_vv(j) = berry;
                d_cc(j) = -berry;
                // <v| dH |c> = (E_c - E_v) <v| d c>
                const h_complex transition = U.col(0).dot(pauli_combination(grad) * U.col(1));
                d_vc(j) = imaginary_unit * transition / (2. * e);
            }
            check_finite(d_vv, kx(i), ky(i), "Berry connection");
            check_finite(d_vc, kx(i), ky(i), "interband dipole");

            ret.vv_x(i) = d_vv(0);
            ret.vv_y(i) = d_vv(1);
            ret.vc_x(i) = d_vc(0);
            ret.vc_y(i) = d_vc(1);
            ret.cc_x(i) = d_cc(0);
            ret.cc_y(i) = d_cc(1);
        }
        return ret;
    }

    HamiltonianDerivative TwoBandSystem::hamiltonian_derivative(const nd_vector& kx, const nd_vector& ky) const
    {
        check_sizes(kx, ky);
        HamiltonianDerivative ret{ band_matrix_array(kx.size()), band_matrix_array(kx.size()) };
        for (Eigen::Index i = 0; i < kx.size(); ++i) {
            const Coefficients c = checked_coefficients(kx(i), ky(i));
            ret.x[i] = c.grad_h0(0) * band_matrix::Identity() + pauli_combination(c.grad_d.col(0));
            ret.y[i] = c.grad_h0(1) * band_matrix::Identity() + pauli_combination(c.grad_d.col(1));
        }
        return ret;
    }

    band_matrix_array TwoBandSystem::eigenvectors(const nd_vector& kx, const nd_vector& ky) const
    {
        check_sizes(kx, ky);
        band_matrix_array ret(kx.size());
        for (Eigen::Index i = 0; i < kx.size(); ++i) {
            ret[i] = eigenvector_matrix(checked_coefficients(kx(i), ky(i)).d);
            check_finite(ret[i], kx(i), ky(i), "eigenvector");
        }
        return ret;
    }
}
