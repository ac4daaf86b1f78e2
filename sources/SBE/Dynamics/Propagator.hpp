#pragma once

#include "../GlobalDefinitions.hpp"
#include "../TimeIntegrationConfig.hpp"
#include "GaugeStrategy.hpp"
#include "BDFStepper.hpp"
#include "SolutionTensor.hpp"
#include <vector>

namespace SBE::Dynamics {
    /**
     * Integrates the equations of motion of one path with the BDF stepper.
     * Every path is sampled on the same grid: n_subdivisions integrator steps per sample,
     * time_config.n_samples() samples starting at t_begin.
     */
    class Propagator {
    public:
        explicit Propagator(const TimeIntegrationConfig& _time_config, const BDFSettings& _settings = BDFSettings{});

        /**
         * Starts from gauge.equilibrium_state() at t_begin.
         * 
         * @param path_index slice of the solution tensor that receives the samples
         * @param vector_potential if not null, receives A(t) at every sample
         * @return number of rejected internal steps
         */
        long propagate(GaugeStrategy& gauge, int path_index, SolutionTensor& solution, 
            std::vector<h_float>* vector_potential = nullptr) const;
    private:
        const TimeIntegrationConfig time_config;
        const BDFSettings settings;
    };
}
