#pragma once

#include "../GlobalDefinitions.hpp"
#include "../SimulationConfig.hpp"
#include "../TimeIntegrationConfig.hpp"
#include "../Laser/Laser.hpp"
#include "../Mesh/KPath.hpp"
#include "../Systems/BandModel.hpp"
#include "../Dynamics/SolutionTensor.hpp"
#include "../Dynamics/BDFStepper.hpp"
#include "../Observables/EmissionCalculator.hpp"

#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

namespace SBE::Dispatch {
    /**
     * Sets up band model, mesh, pulse and time grid of a run and propagates the paths assigned to this rank.
     * All series are partial sums over the local paths and have to be reduced over the ranks.
     */
    struct Dispatcher {
        const SimulationConfig& config;
        std::unique_ptr<Systems::BandModel> model;
        std::unique_ptr<Laser::Laser> laser;
        Mesh::KMesh mesh;
        TimeIntegrationConfig time_config;
        Dynamics::BDFSettings integrator_settings;

        int first_path{};
        std::vector<Mesh::Path> local_paths;
        Dynamics::SolutionTensor solution;
        std::vector<h_float> vector_potential;

        Observables::DirectionalSeries emission;
        Observables::DirectionalSeries polarization;
        Observables::DirectionalSeries current;
        long rejected_steps{};

        explicit Dispatcher(const SimulationConfig& _config);

        void compute(int rank, int n_ranks);

        std::vector<h_float> time_samples() const;
        std::vector<h_float> electric_field() const;

        nlohmann::json special_information() const;

        static std::unique_ptr<Systems::BandModel> make_band_model(const SimulationConfig& config);
        static Mesh::KMesh make_mesh(const SimulationConfig& config);
    private:
        void propagate_local_paths();
        void compute_observables();
    };
}
