#pragma once

#include "../GlobalDefinitions.hpp"
#include "../Systems/BandModel.hpp"

namespace SBE::Dynamics {
    /**
     * Band structure data entering the equations of motion, one value per k-point of a path.
     * The dipoles are projected onto the field direction and multiplied by E(t) inside the equations.
     */
    struct PathCoefficients {
        nd_vector ecv;                  ///< E_c - E_v
        nd_vector e_c;                  ///< E_c
        nd_complex_vector dipole;       ///< E_dir . d_vc
        nd_complex_vector diag_dipole;  ///< E_dir . (d_vv - d_cc)

        inline int size() const noexcept {
            return static_cast<int>(ecv.size());
        }

        /**
         * @param dipole_off sets all dipoles to zero, leaving only the intraband dynamics
         */
        static PathCoefficients evaluate(const Systems::BandModel& model, const nd_vector& kx, const nd_vector& ky, 
            const real_vector<2>& E_dir, bool dipole_off);
    };
}
