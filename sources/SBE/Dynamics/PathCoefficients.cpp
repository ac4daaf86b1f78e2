#include "PathCoefficients.hpp"
#include "../Errors.hpp"

namespace SBE::Dynamics {
    PathCoefficients PathCoefficients::evaluate(const Systems::BandModel& model, const nd_vector& kx, const nd_vector& ky, 
        const real_vector<2>& E_dir, bool dipole_off)
    {
        const Systems::BandEnergies energies = model.energies(kx, ky);
        PathCoefficients ret;
        ret.ecv = energies.conduction - energies.valence;
        ret.e_c = energies.conduction;

        if (dipole_off) {
            ret.dipole = nd_complex_vector::Zero(kx.size());
            ret.diag_dipole = nd_complex_vector::Zero(kx.size());
        }
        else {
            const Systems::DipoleElements d = model.dipoles(kx, ky);
            ret.dipole = E_dir(0) * d.vc_x + E_dir(1) * d.vc_y;
            ret.diag_dipole = E_dir(0) * d.vv_x + E_dir(1) * d.vv_y - (E_dir(0) * d.cc_x + E_dir(1) * d.cc_y);
        }

        for (Eigen::Index i = 0; i < kx.size(); ++i) {
            if (!std::isfinite(ret.ecv(i)) || !is_finite(ret.dipole(i)) || !is_finite(ret.diag_dipole(i))) {
                throw NumericalDomainError("Non-finite band coefficients along the path", kx(i), ky(i));
            }
        }
        return ret;
    }
}
