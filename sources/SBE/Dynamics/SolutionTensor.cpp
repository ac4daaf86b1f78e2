#include "SolutionTensor.hpp"
#include "../Errors.hpp"
#include <algorithm>

namespace SBE::Dynamics {
    SolutionTensor::SolutionTensor(int n_k, int n_paths, int n_times)
        : _n_k{n_k}, _n_paths{n_paths}, _n_times{n_times}
    {
        if (n_k < 1 || n_paths < 0 || n_times < 1) {
            throw ConfigurationError("Invalid solution tensor shape (" + std::to_string(n_k) + ", " 
                + std::to_string(n_paths) + ", " + std::to_string(n_times) + ")");
        }
        data.assign(static_cast<size_t>(n_k) * n_paths * n_times * n_components, h_complex{});
    }

    void SolutionTensor::store(int path, int time, const state_type& state)
    {
        check_state_layout(state, _n_k);
        ConstDensityMatrixView rho(state);
        for (int k = 0; k < _n_k; ++k) {
            for (const Component c : { f_v, p_vc, p_cv, f_c }) {
                (*this)(k, path, time, c) = rho(k, c);
            }
        }
    }

    nlohmann::json SolutionTensor::to_json() const
    {
        std::vector<h_float> real_part(data.size());
        std::vector<h_float> imag_part(data.size());
        std::transform(data.begin(), data.end(), real_part.begin(), [](const h_complex& z) { return z.real(); });
        std::transform(data.begin(), data.end(), imag_part.begin(), [](const h_complex& z) { return z.imag(); });

        return nlohmann::json {
            { "shape",          { _n_k, _n_paths, _n_times, n_components } },
            { "layout",         "k, path, time, (f_v, p_vc, p_cv, f_c)" },
            { "solution_real",  real_part },
            { "solution_imag",  imag_part }
        };
    }
}
