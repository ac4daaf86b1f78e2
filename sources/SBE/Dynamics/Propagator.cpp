#include "Propagator.hpp"
#include "../Errors.hpp"

#include <utility>
#include <iostream>
#include <boost/ref.hpp>
#include <boost/numeric/odeint.hpp>

namespace SBE::Dynamics {
    Propagator::Propagator(const TimeIntegrationConfig& _time_config, const BDFSettings& _settings)
        : time_config(_time_config), settings(_settings)
    {
        if (time_config.n_measurements < 1 || time_config.n_subdivisions < 1) {
            throw ConfigurationError("The time grid needs at least two samples and one step per sample");
        }
        if (!(time_config.t_end > time_config.t_begin)) {
            throw ConfigurationError("Integration has to proceed forward in time, got t_begin=" 
                + std::to_string(time_config.t_begin) + " and t_end=" + std::to_string(time_config.t_end));
        }
    }

    long Propagator::propagate(GaugeStrategy& gauge, int path_index, SolutionTensor& solution, 
        std::vector<h_float>* vector_potential) const
    {
        if (path_index < 0 || path_index >= solution.n_paths()) {
            throw ConfigurationError("Path index " + std::to_string(path_index) + " is out of range");
        }
        if (solution.n_times() != time_config.n_samples()) {
            throw ConfigurationError("The solution tensor holds " + std::to_string(solution.n_times()) 
                + " samples, the time grid " + std::to_string(time_config.n_samples()));
        }
        if (vector_potential) {
            vector_potential->resize(time_config.n_samples());
        }

        state_type current_state = gauge.equilibrium_state();
        check_state_layout(current_state, solution.n_k());

        auto right_side = [&gauge](const state_type& y, state_type& dydt, const h_float t) {
            gauge.rhs(y, dydt, t);
        };
        auto jacobian = [&gauge](const state_type& y, GaugeStrategy::sparse_matrix& J, const h_float t) {
            gauge.jacobian(y, J, t);
        };

        const int stride = time_config.n_subdivisions;
        int step{};
        int sample{};
        auto observer = [&](const state_type& y, const h_float /* t */) {
            if (step % stride == 0) {
                solution.store(path_index, sample, y);
                if (vector_potential) {
                    (*vector_potential)[sample] = y(y.size() - 1).real();
                }
                ++sample;
            }
            ++step;
        };

        BDFStepper stepper(settings);
        const size_t n_steps = static_cast<size_t>(time_config.n_measurements) * stride;
        try {
            boost::numeric::odeint::integrate_n_steps(boost::ref(stepper), std::make_pair(right_side, jacobian), 
                current_state, time_config.t_begin, time_config.dt(), n_steps, observer);
        }
        catch (const IntegrationFailure&) {
            std::cerr << "Propagation of path " << path_index << " failed in the " << gauge.name() << " gauge" << std::endl;
            throw;
        }
        return stepper.rejected_steps();
    }
}
