#pragma once

#include "EmissionCalculator.hpp"

namespace SBE::Observables {
    /**
     * Interband polarization P(t) = 2 Re sum_{path, k} (e . d_vc) p_vc
     * Dipoles are evaluated on the unshifted k-grid.
     */
    DirectionalSeries polarization(const Systems::BandModel& model, const std::vector<Mesh::Path>& paths,
        const Dynamics::SolutionTensor& solution, const real_vector<2>& E_dir);

    /**
     * Intraband current J(t) = Re sum_{path, k} (e . grad E_c) f_c + (e . grad E_v) f_v
     * Band velocities are evaluated on the unshifted k-grid.
     */
    DirectionalSeries intraband_current(const Systems::BandModel& model, const std::vector<Mesh::Path>& paths,
        const Dynamics::SolutionTensor& solution, const real_vector<2>& E_dir);

    /// Second order central differences in the interior, one-sided differences at both ends
    std::vector<h_float> time_derivative(const std::vector<h_float>& series, h_float dt);

    /// I(t) = dP/dt + J
    DirectionalSeries approximate_emission(const DirectionalSeries& polarization, const DirectionalSeries& current, h_float dt);
}
