#include "Dispatcher.hpp"
#include "../Errors.hpp"
#include "../Laser/ChirpedGaussLaser.hpp"
#include "../Systems/BiTe.hpp"
#include "../Dynamics/GaugeStrategy.hpp"
#include "../Dynamics/Propagator.hpp"
#include "../Observables/CurrentAndPolarization.hpp"

#include <mrock/utility/progress_bar.hpp>
#include <omp.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <numeric>

#if defined(NO_MPI) && !defined(MROCK_CL1_CASCADE)
#define PROGRESS_BAR_UPDATE(n_max) ++(progresses[omp_get_thread_num()]); \
            if (omp_get_thread_num() == 0) { \
                mrock::utility::progress_bar( \
                    static_cast<float>(std::reduce(progresses.begin(), progresses.end())) / static_cast<float>((n_max)) \
                ); \
            }
#else
#define PROGRESS_BAR_UPDATE(n_max)
#endif

namespace SBE::Dispatch {
    Dispatcher::Dispatcher(const SimulationConfig& _config)
        : config(_config), model(make_band_model(_config)),
        laser(std::make_unique<Laser::ChirpedGaussLaser>(_config.E0, _config.w, _config.chirp, _config.alpha, _config.phase)),
        mesh(make_mesh(_config)),
        time_config(TimeIntegrationConfig::centered(_config.t0, _config.dt, _config.Nt))
    { }

    std::unique_ptr<Systems::BandModel> Dispatcher::make_band_model(const SimulationConfig& config)
    {
        if (config.is_resummed()) {
            return std::make_unique<Systems::BiTe>(config.C0, config.C2, config.A, config.R, config.k_sym, config.k_asym);
        }
        return std::make_unique<Systems::BiTe>(config.C0, config.C2, config.A, config.R);
    }

    Mesh::KMesh Dispatcher::make_mesh(const SimulationConfig& config)
    {
        if (config.is_two_line()) {
            return Mesh::two_line_mesh(config.Nk_in_path, config.rel_dist_to_Gamma, config.path_length, 
                config.lattice_constant, config.angle_inc_E_field);
        }
        return Mesh::hexagonal_mesh(config.Nk1, config.Nk2, config.lattice_constant, config.align);
    }

    void Dispatcher::compute(int rank, int n_ranks)
    {
        const int n_paths = mesh.n_paths();
        int jobs_per_rank = n_paths / n_ranks;
        if (jobs_per_rank * n_ranks < n_paths) ++jobs_per_rank;
        first_path = std::min(rank * jobs_per_rank, n_paths);
        const int last_path = std::min(first_path + jobs_per_rank, n_paths);
        local_paths.assign(mesh.paths.begin() + first_path, mesh.paths.begin() + last_path);

        std::chrono::high_resolution_clock::time_point begin = std::chrono::high_resolution_clock::now();
        std::cout << "Propagating " << local_paths.size() << " of " << n_paths << " paths with " 
            << mesh.points_per_path() << " k-points each..." << std::endl;
        propagate_local_paths();
        std::chrono::high_resolution_clock::time_point end = std::chrono::high_resolution_clock::now();
        std::cout << "Runtime = " << std::chrono::duration_cast<std::chrono::milliseconds>(end - begin).count() << "[ms]" << std::endl;
        if (rejected_steps > 0) {
            std::cout << "The integrator halved its step " << rejected_steps << " times" << std::endl;
        }

        begin = std::chrono::high_resolution_clock::now();
        std::cout << "Computing the observables..." << std::endl;
        compute_observables();
        end = std::chrono::high_resolution_clock::now();
        std::cout << "Runtime = " << std::chrono::duration_cast<std::chrono::milliseconds>(end - begin).count() << "[ms]" << std::endl;
    }

    void Dispatcher::propagate_local_paths()
    {
        const int n_local = static_cast<int>(local_paths.size());
        solution = Dynamics::SolutionTensor(mesh.points_per_path(), n_local, time_config.n_samples());
        vector_potential.assign(time_config.n_samples(), h_float{});

        const Dynamics::Propagator propagator(time_config, integrator_settings);
        const Dynamics::Relaxation relaxation = config.relaxation();
        std::exception_ptr error;
        long rejected{};

#ifdef NO_MPI
        std::vector<int> progresses(omp_get_max_threads(), int{});
#pragma omp parallel for reduction(+:rejected) schedule(dynamic)
#endif
        for (int p = 0; p < n_local; ++p) {
            PROGRESS_BAR_UPDATE(n_local);
            try {
                auto gauge = Dynamics::make_gauge_strategy(config.gauge, local_paths[p], *laser, *model, mesh.E_dir, 
                    config.dipole_off, config.e_fermi, config.temperature, relaxation);
                // A(t) is the same on every path
                rejected += propagator.propagate(*gauge, p, solution, p == 0 ? &vector_potential : nullptr);
            }
            catch (const std::exception&) {
#pragma omp critical
                {
                    if (!error) error = std::current_exception();
                }
            }
        }
        if (error) std::rethrow_exception(error);
        rejected_steps = rejected;
    }

    void Dispatcher::compute_observables()
    {
        if (local_paths.empty()) {
            emission = Observables::DirectionalSeries(time_config.n_samples());
            polarization = Observables::DirectionalSeries(time_config.n_samples());
            current = Observables::DirectionalSeries(time_config.n_samples());
            return;
        }
        const Observables::EmissionCalculator calculator(*model, mesh.E_dir, config.gauge, time_config);
        emission = calculator.compute(local_paths, solution, vector_potential);
        polarization = Observables::polarization(*model, local_paths, solution, mesh.E_dir);
        current = Observables::intraband_current(*model, local_paths, solution, mesh.E_dir);
    }

    std::vector<h_float> Dispatcher::time_samples() const
    {
        std::vector<h_float> times(time_config.n_samples());
        for (int i = 0; i < time_config.n_samples(); ++i) {
            times[i] = time_config.time(i);
        }
        return times;
    }

    std::vector<h_float> Dispatcher::electric_field() const
    {
        std::vector<h_float> field(time_config.n_samples());
        for (int i = 0; i < time_config.n_samples(); ++i) {
            field[i] = laser->electric_field(time_config.time(i));
        }
        return field;
    }

    nlohmann::json Dispatcher::special_information() const
    {
        nlohmann::json paths_json = nlohmann::json::array();
        for (const auto& path : local_paths) {
            const nd_vector kx = path.kx();
            const nd_vector ky = path.ky();
            paths_json.push_back({ {"kx", std::vector<h_float>(kx.begin(), kx.end())}, 
                {"ky", std::vector<h_float>(ky.begin(), ky.end())}, {"dk", path.dk} });
        }
        return nlohmann::json{
            { "model",              model->to_json() },
            { "E_dir",              { mesh.E_dir(0), mesh.E_dir(1) } },
            { "n_paths",            mesh.n_paths() },
            { "points_per_path",    mesh.points_per_path() },
            { "first_local_path",   first_path },
            { "local_paths",        paths_json },
            { "t_begin",            time_config.t_begin },
            { "t_end",              time_config.t_end },
            { "n_measurements",     time_config.n_measurements },
            { "n_subdivisions",     time_config.n_subdivisions },
            { "rejected_steps",     rejected_steps }
        };
    }
}
