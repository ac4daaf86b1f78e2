#include "EmissionCalculator.hpp"
#include "../Errors.hpp"

#include <exception>
#include <omp.h>

namespace SBE::Observables {
    EmissionCalculator::EmissionCalculator(const Systems::BandModel& _model, const real_vector<2>& _E_dir, Dynamics::Gauge _gauge,
        const TimeIntegrationConfig& _time_config)
        : model(_model), E_dir(_E_dir), E_ort{ _E_dir(1), -_E_dir(0) }, gauge{_gauge}, time_config(_time_config)
    { }

    EmissionCalculator::ProjectedDerivatives EmissionCalculator::band_basis_derivatives(const Mesh::Path& path, h_float shift) const
    {
        const nd_vector kx = path.kx(shift, E_dir);
        const nd_vector ky = path.ky(shift, E_dir);
        const Systems::HamiltonianDerivative dH = model.hamiltonian_derivative(kx, ky);
        const Systems::band_matrix_array U = model.eigenvectors(kx, ky);

        ProjectedDerivatives ret{ Systems::band_matrix_array(path.size()), Systems::band_matrix_array(path.size()) };
        for (int k = 0; k < path.size(); ++k) {
            ret.along[k] = U[k].adjoint() * (E_dir(0) * dH.x[k] + E_dir(1) * dH.y[k]) * U[k];
            ret.ortho[k] = U[k].adjoint() * (E_ort(0) * dH.x[k] + E_ort(1) * dH.y[k]) * U[k];
        }
        return ret;
    }

    EmissionSeries EmissionCalculator::compute(const std::vector<Mesh::Path>& paths, const Dynamics::SolutionTensor& solution, 
        const std::vector<h_float>& vector_potential) const
    {
        using namespace Dynamics;
        const int n_paths = solution.n_paths();
        const int n_times = solution.n_times();
        if (static_cast<int>(paths.size()) != n_paths) {
            throw ConfigurationError("Got " + std::to_string(paths.size()) + " paths for a solution with " 
                + std::to_string(n_paths) + " paths");
        }
        for (const auto& path : paths) {
            if (path.size() != solution.n_k()) {
                throw ConfigurationError("Path length " + std::to_string(path.size()) 
                    + " does not match the solution tensor (" + std::to_string(solution.n_k()) + ")");
            }
        }
        if (time_config.n_samples() != n_times) {
            throw ConfigurationError("The solution tensor holds " + std::to_string(n_times) 
                + " samples, the time grid " + std::to_string(time_config.n_samples()));
        }
        const bool velocity = (gauge == Gauge::Velocity);
        if (velocity && static_cast<int>(vector_potential.size()) != n_times) {
            throw ConfigurationError("The velocity gauge needs the vector potential at all " + std::to_string(n_times) + " samples");
        }
        const h_float valence_subtraction = velocity ? h_float{1} : h_float{};

        // Without momentum shift the band basis does not depend on time
        std::vector<ProjectedDerivatives> static_derivatives;
        if (!velocity) {
            static_derivatives.reserve(n_paths);
            for (const auto& path : paths) {
                static_derivatives.push_back(band_basis_derivatives(path, h_float{}));
            }
        }

        EmissionSeries emission(n_times);
        std::exception_ptr error;

#pragma omp parallel for schedule(dynamic)
        for (int t = 0; t < n_times; ++t) {
            try {
                h_float along{};
                h_float ortho{};
                for (int p = 0; p < n_paths; ++p) {
                    const ProjectedDerivatives M = velocity 
                        ? band_basis_derivatives(paths[p], vector_potential[t])
                        : static_derivatives[p];

                    for (int k = 0; k < solution.n_k(); ++k) {
                        const h_float occupation_v = solution(k, p, t, f_v).real() - valence_subtraction;
                        const h_float occupation_c = solution(k, p, t, f_c).real();
                        const h_complex coherence = solution(k, p, t, p_cv);

                        along += M.along[k](0, 0).real() * occupation_v + M.along[k](1, 1).real() * occupation_c
                            + 2. * (M.along[k](0, 1) * coherence).real();
                        ortho += M.ortho[k](0, 0).real() * occupation_v + M.ortho[k](1, 1).real() * occupation_c
                            + 2. * (M.ortho[k](0, 1) * coherence).real();
                    }
                }
                emission.E_dir[t] = along;
                emission.ortho[t] = ortho;
            }
            catch (const NumericalDomainError& e) {
                const NumericalDomainError located("Band model failed at the shifted momentum", e.kx, e.ky, time_config.time(t));
#pragma omp critical
                {
                    if (!error) error = std::make_exception_ptr(located);
                }
            }
            catch (const std::exception&) {
#pragma omp critical
                {
                    if (!error) error = std::current_exception();
                }
            }
        }
        if (error) std::rethrow_exception(error);

        return emission;
    }
}
