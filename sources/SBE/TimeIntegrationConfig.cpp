#include "TimeIntegrationConfig.hpp"
#include "Errors.hpp"

namespace SBE {
    h_float TimeIntegrationConfig::dt() const
    {
        return measure_every() / n_subdivisions;
    }

    h_float TimeIntegrationConfig::measure_every() const
    {
        return (t_end - t_begin) / n_measurements;
    }

    TimeIntegrationConfig TimeIntegrationConfig::centered(h_float half_window, h_float dt, int n_samples)
    {
        if (n_samples < 2) {
            throw ConfigurationError("At least two output samples are required, got Nt=" + std::to_string(n_samples));
        }
        if (!(dt > 0)) {
            throw ConfigurationError("The time step must be positive, got dt=" + std::to_string(dt));
        }
        const long n_steps = static_cast<long>(std::abs(2 * half_window) / dt);
        int stride = static_cast<int>((n_steps + n_samples - 1) / n_samples);
        if (stride < 1) stride = 1;

        const h_float total = static_cast<h_float>(stride) * n_samples * dt;
        const h_float t_begin = -0.5 * total;
        return TimeIntegrationConfig{ t_begin, t_begin + (n_samples - 1) * stride * dt, n_samples - 1, stride };
    }

    std::ostream& operator<<(std::ostream& os, TimeIntegrationConfig const& tconfig)
    {
        os << "TimeIntegrationConfig object:\nt_begin=" << tconfig.t_begin << "   t_end=" << tconfig.t_end 
            << "\nn_measurements=" << tconfig.n_measurements << "   n_subdivisions=" << tconfig.n_subdivisions
            << "\n";
        return os;
    }
}
