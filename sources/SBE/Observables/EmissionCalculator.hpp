#pragma once

#include "../GlobalDefinitions.hpp"
#include "../TimeIntegrationConfig.hpp"
#include "../Mesh/KPath.hpp"
#include "../Systems/BandModel.hpp"
#include "../Dynamics/GaugeStrategy.hpp"
#include "../Dynamics/SolutionTensor.hpp"
#include <vector>

namespace SBE::Observables {
    /// Time series along the field direction and along E_ort = (E_dir_y, -E_dir_x)
    struct DirectionalSeries {
        std::vector<h_float> E_dir;
        std::vector<h_float> ortho;

        DirectionalSeries() = default;
        explicit DirectionalSeries(size_t N) : E_dir(N), ortho(N) {}
    };
    using EmissionSeries = DirectionalSeries;

    /**
     * Emission from the exact velocity operator in the band basis
     *   I(t) = sum_{path, k} Re(M_vv) (Re f_v - s) + Re(M_cc) Re f_c + 2 Re(M_vc p_cv),    M = U^+ (e . grad_k H) U
     * In the velocity gauge H and U are evaluated at k + A(t) E_dir and the filled valence band is
     * subtracted (s = 1), in the length gauge s = 0.
     */
    class EmissionCalculator {
    public:
        /// @param _time_config grid of the samples in the solution tensor
        EmissionCalculator(const Systems::BandModel& _model, const real_vector<2>& _E_dir, Dynamics::Gauge _gauge,
            const TimeIntegrationConfig& _time_config);

        /**
         * A failing band model evaluation is reported with the time of the sample.
         * 
         * @param paths paths[i] belongs to slice i of the solution tensor
         * @param vector_potential A(t) at every sample, only read in the velocity gauge
         */
        EmissionSeries compute(const std::vector<Mesh::Path>& paths, const Dynamics::SolutionTensor& solution, 
            const std::vector<h_float>& vector_potential) const;
    private:
        const Systems::BandModel& model;
        const real_vector<2> E_dir;
        const real_vector<2> E_ort;
        const Dynamics::Gauge gauge;
        const TimeIntegrationConfig time_config;

        struct ProjectedDerivatives {
            Systems::band_matrix_array along;
            Systems::band_matrix_array ortho;
        };
        ProjectedDerivatives band_basis_derivatives(const Mesh::Path& path, h_float shift) const;
    };
}
