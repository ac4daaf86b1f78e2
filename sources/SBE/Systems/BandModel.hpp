#pragma once

#include "../GlobalDefinitions.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace SBE::Systems {
    using band_matrix = complex_matrix<2, 2>;
    using band_matrix_array = std::vector<band_matrix>;

    // index 0 is the valence band, index 1 the conduction band
    struct BandEnergies {
        nd_vector valence;
        nd_vector conduction;
    };

    struct EnergyDerivatives {
        nd_vector valence_x;
        nd_vector valence_y;
        nd_vector conduction_x;
        nd_vector conduction_y;
    };

    /// Dipole matrix elements d_nm = i <n|grad_k|m>
    struct DipoleElements {
        nd_complex_vector vv_x;
        nd_complex_vector vc_x;
        nd_complex_vector cc_x;
        nd_complex_vector vv_y;
        nd_complex_vector vc_y;
        nd_complex_vector cc_y;
    };

    struct HamiltonianDerivative {
        band_matrix_array x;
        band_matrix_array y;
    };

    /**
     * Band structure of a two band crystal.
     * Parameters are bound on construction, all evaluations are pure and thread safe.
     * Every function takes arrays of points (kx[i], ky[i]) and returns one value per point.
     */
    class BandModel {
    public:
        virtual ~BandModel() = default;

        virtual BandEnergies energies(const nd_vector& kx, const nd_vector& ky) const = 0;
        virtual EnergyDerivatives energy_derivatives(const nd_vector& kx, const nd_vector& ky) const = 0;
        virtual DipoleElements dipoles(const nd_vector& kx, const nd_vector& ky) const = 0;
        virtual HamiltonianDerivative hamiltonian_derivative(const nd_vector& kx, const nd_vector& ky) const = 0;
        /// Columns are the valence and conduction eigenvectors
        virtual band_matrix_array eigenvectors(const nd_vector& kx, const nd_vector& ky) const = 0;

        virtual std::string info() const = 0;
        virtual nlohmann::json to_json() const = 0;
    };
}
