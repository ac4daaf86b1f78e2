#include "CurrentAndPolarization.hpp"
#include "../Errors.hpp"

#include <algorithm>
#include <functional>
#include <omp.h>

namespace SBE::Observables {
    namespace {
        void check_paths(const std::vector<Mesh::Path>& paths, const Dynamics::SolutionTensor& solution)
        {
            if (static_cast<int>(paths.size()) != solution.n_paths()) {
                throw ConfigurationError("Got " + std::to_string(paths.size()) + " paths for a solution with " 
                    + std::to_string(solution.n_paths()) + " paths");
            }
            for (const auto& path : paths) {
                if (path.size() != solution.n_k()) {
                    throw ConfigurationError("Path length " + std::to_string(path.size()) 
                        + " does not match the solution tensor (" + std::to_string(solution.n_k()) + ")");
                }
            }
        }
    }

    DirectionalSeries polarization(const Systems::BandModel& model, const std::vector<Mesh::Path>& paths,
        const Dynamics::SolutionTensor& solution, const real_vector<2>& E_dir)
    {
        check_paths(paths, solution);
        const real_vector<2> E_ort{ E_dir(1), -E_dir(0) };

        std::vector<nd_complex_vector> d_along;
        std::vector<nd_complex_vector> d_ortho;
        for (const auto& path : paths) {
            const Systems::DipoleElements d = model.dipoles(path.kx(), path.ky());
            d_along.push_back(E_dir(0) * d.vc_x + E_dir(1) * d.vc_y);
            d_ortho.push_back(E_ort(0) * d.vc_x + E_ort(1) * d.vc_y);
        }

        DirectionalSeries P(solution.n_times());
#pragma omp parallel for
        for (int t = 0; t < solution.n_times(); ++t) {
            for (int p = 0; p < solution.n_paths(); ++p) {
                for (int k = 0; k < solution.n_k(); ++k) {
                    const h_complex p_vc = solution(k, p, t, Dynamics::p_vc);
                    P.E_dir[t] += 2. * (d_along[p](k) * p_vc).real();
                    P.ortho[t] += 2. * (d_ortho[p](k) * p_vc).real();
                }
            }
        }
        return P;
    }

    DirectionalSeries intraband_current(const Systems::BandModel& model, const std::vector<Mesh::Path>& paths,
        const Dynamics::SolutionTensor& solution, const real_vector<2>& E_dir)
    {
        check_paths(paths, solution);
        const real_vector<2> E_ort{ E_dir(1), -E_dir(0) };

        std::vector<Systems::EnergyDerivatives> velocities;
        for (const auto& path : paths) {
            velocities.push_back(model.energy_derivatives(path.kx(), path.ky()));
        }

        DirectionalSeries J(solution.n_times());
#pragma omp parallel for
        for (int t = 0; t < solution.n_times(); ++t) {
            for (int p = 0; p < solution.n_paths(); ++p) {
                const Systems::EnergyDerivatives& v = velocities[p];
                for (int k = 0; k < solution.n_k(); ++k) {
                    const h_float f_v = solution(k, p, t, Dynamics::f_v).real();
                    const h_float f_c = solution(k, p, t, Dynamics::f_c).real();
                    J.E_dir[t] += (E_dir(0) * v.conduction_x(k) + E_dir(1) * v.conduction_y(k)) * f_c
                        + (E_dir(0) * v.valence_x(k) + E_dir(1) * v.valence_y(k)) * f_v;
                    J.ortho[t] += (E_ort(0) * v.conduction_x(k) + E_ort(1) * v.conduction_y(k)) * f_c
                        + (E_ort(0) * v.valence_x(k) + E_ort(1) * v.valence_y(k)) * f_v;
                }
            }
        }
        return J;
    }

    std::vector<h_float> time_derivative(const std::vector<h_float>& series, h_float dt)
    {
        if (series.size() < 2U) {
            throw ConfigurationError("A time derivative needs at least two samples");
        }
        if (!(dt > 0)) {
            throw ConfigurationError("The sampling interval must be positive");
        }
        const size_t N = series.size();
        std::vector<h_float> derivative(N);
        derivative.front() = (series[1] - series[0]) / dt;
        for (size_t i = 1U; i + 1U < N; ++i) {
            derivative[i] = (series[i + 1] - series[i - 1]) / (2. * dt);
        }
        derivative.back() = (series[N - 1] - series[N - 2]) / dt;
        return derivative;
    }

    DirectionalSeries approximate_emission(const DirectionalSeries& polarization, const DirectionalSeries& current, h_float dt)
    {
        if (polarization.E_dir.size() != current.E_dir.size() || polarization.ortho.size() != current.ortho.size()) {
            throw ConfigurationError("Polarization and current must be sampled on the same grid");
        }
        DirectionalSeries emission;
        emission.E_dir = time_derivative(polarization.E_dir, dt);
        emission.ortho = time_derivative(polarization.ortho, dt);
        std::transform(emission.E_dir.begin(), emission.E_dir.end(), current.E_dir.begin(), emission.E_dir.begin(), std::plus<h_float>());
        std::transform(emission.ortho.begin(), emission.ortho.end(), current.ortho.begin(), emission.ortho.begin(), std::plus<h_float>());
        return emission;
    }
}
