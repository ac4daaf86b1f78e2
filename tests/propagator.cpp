#include <catch2/catch.hpp>

#include "SBE/Dynamics/Propagator.hpp"
#include "SBE/Laser/ChirpedGaussLaser.hpp"
#include "SBE/Systems/BiTe.hpp"
#include "SBE/Errors.hpp"

#include <algorithm>

using namespace SBE;
using namespace SBE::Dynamics;

namespace {
    const h_float lattice_constant = 8.308;
    const h_float e_fermi = 0.2 * eV_to_au;
    const h_float temperature = 0.03 * eV_to_au;
    const Relaxation relaxation{ 1. / (10. * fs_to_au), 1. / fs_to_au };

    h_float max_deviation_from(const SolutionTensor& solution, int path, const state_type& reference) {
        ConstDensityMatrixView rho(reference);
        h_float deviation{};
        for (int t = 0; t < solution.n_times(); ++t) {
            for (int k = 0; k < solution.n_k(); ++k) {
                for (const Component c : { f_v, p_vc, p_cv, f_c }) {
                    deviation = std::max(deviation, std::abs(solution(k, path, t, c) - rho(k, c)));
                }
            }
        }
        return deviation;
    }
}

TEST_CASE("Propagation of a path", "[dynamics]") {
    const Systems::BiTe model(0., 0., 0.1974, 11.06);
    const Mesh::KMesh mesh = Mesh::two_line_mesh(16, 0.05, 5. * pi / lattice_constant, lattice_constant, 0.);
    const TimeIntegrationConfig time_config = TimeIntegrationConfig::centered(40. * fs_to_au, 0.02 * fs_to_au, 201);
    const Propagator propagator(time_config);

    SECTION("time grid") {
        CHECK(time_config.n_samples() == 201);
        CHECK(time_config.n_subdivisions == 20);
        CHECK(time_config.t_begin == Approx(-0.5 * 20 * 201 * 0.02 * fs_to_au));
        CHECK(time_config.dt() == Approx(0.02 * fs_to_au));
    }

    SECTION("equilibrium is stationary without field") {
        const Laser::ChirpedGaussLaser laser(0., 25. * THz_to_au, 0., 10. * fs_to_au, 0.);
        for (const Gauge g : { Gauge::Length, Gauge::Velocity }) {
            SolutionTensor solution(mesh.points_per_path(), mesh.n_paths(), time_config.n_samples());
            for (int p = 0; p < mesh.n_paths(); ++p) {
                auto gauge = make_gauge_strategy(g, mesh.paths[p], laser, model, mesh.E_dir, false, e_fermi, temperature, relaxation);
                std::vector<h_float> A;
                CHECK(propagator.propagate(*gauge, p, solution, &A) == 0);
                CHECK(max_deviation_from(solution, p, gauge->equilibrium_state()) < 1e-12);
                CHECK(A.size() == 201U);
                CHECK(std::abs(A.back()) < 1e-14);
            }
        }
    }

    SECTION("driven path") {
        const Laser::ChirpedGaussLaser laser(5. * MVpcm_to_au, 25. * THz_to_au, 0., 10. * fs_to_au, 0.);
        for (const Gauge g : { Gauge::Length, Gauge::Velocity }) {
            SolutionTensor solution(mesh.points_per_path(), 1, time_config.n_samples());
            auto gauge = make_gauge_strategy(g, mesh.paths.front(), laser, model, mesh.E_dir, false, e_fermi, temperature, relaxation);
            std::vector<h_float> A;
            propagator.propagate(*gauge, 0, solution, &A);

            ConstDensityMatrixView rho_0(gauge->equilibrium_state());
            h_float initial_density{};
            for (int k = 0; k < solution.n_k(); ++k) {
                initial_density += (rho_0(k, f_v) + rho_0(k, f_c)).real();
                // the first sample is taken at t_begin
                CHECK(solution(k, 0, 0, f_v) == rho_0(k, f_v));
                CHECK(solution(k, 0, 0, f_c) == rho_0(k, f_c));
                CHECK(solution(k, 0, 0, p_vc) == h_complex{});
            }

            h_float max_coherence{};
            for (int t = 0; t < solution.n_times(); ++t) {
                h_float density{};
                for (int k = 0; k < solution.n_k(); ++k) {
                    CHECK(std::abs(solution(k, 0, t, p_cv) - std::conj(solution(k, 0, t, p_vc))) < 1e-7);
                    density += (solution(k, 0, t, f_v) + solution(k, 0, t, f_c)).real();
                    max_coherence = std::max(max_coherence, std::abs(solution(k, 0, t, p_vc)));
                }
                // the gradient term only redistributes, relaxation restores the initial density
                CHECK(density == Approx(initial_density).epsilon(1e-7));
            }
            CHECK(max_coherence > 0.);

            // A(t) = -int E dt
            h_float reference{};
            const int n_fine = 100;
            const h_float t_end = time_config.t_end;
            const h_float h = (t_end - time_config.t_begin) / (n_fine * time_config.n_measurements);
            for (int i = 0; i < n_fine * time_config.n_measurements; ++i) {
                const h_float t = time_config.t_begin + (i + 0.5) * h;
                reference -= laser.electric_field(t) * h;
            }
            h_float max_A{};
            for (const h_float a : A) max_A = std::max(max_A, std::abs(a));
            CHECK(std::abs(A.back() - reference) < 1e-3 * max_A);
        }
    }

    SECTION("single k-point") {
        const Mesh::KMesh single = Mesh::two_line_mesh(1, 0.05, 5. * pi / lattice_constant, lattice_constant, 0.);
        const Laser::ChirpedGaussLaser laser(5. * MVpcm_to_au, 25. * THz_to_au, 0., 10. * fs_to_au, 0.);
        SolutionTensor solution(1, 1, time_config.n_samples());
        auto gauge = make_gauge_strategy(Gauge::Length, single.paths.front(), laser, model, single.E_dir, false, 
            e_fermi, temperature, relaxation);
        REQUIRE_NOTHROW(propagator.propagate(*gauge, 0, solution));
        for (int t = 0; t < solution.n_times(); ++t) {
            CHECK(is_finite(solution(0, 0, t, p_vc)));
        }
    }

    SECTION("invalid arguments") {
        const Laser::ChirpedGaussLaser laser(0., 25. * THz_to_au, 0., 10. * fs_to_au, 0.);
        auto gauge = make_gauge_strategy(Gauge::Length, mesh.paths.front(), laser, model, mesh.E_dir, false, 
            e_fermi, temperature, relaxation);
        SolutionTensor solution(mesh.points_per_path(), 1, time_config.n_samples());
        CHECK_THROWS_AS(propagator.propagate(*gauge, 1, solution), ConfigurationError);

        SolutionTensor too_short(mesh.points_per_path(), 1, 10);
        CHECK_THROWS_AS(propagator.propagate(*gauge, 0, too_short), ConfigurationError);

        CHECK_THROWS_AS(Propagator(TimeIntegrationConfig{ 1., 0., 10, 1 }), ConfigurationError);
        CHECK_THROWS_AS(TimeIntegrationConfig::centered(10., 0., 10), ConfigurationError);
    }
}

TEST_CASE("Solution tensor", "[dynamics]") {
    SolutionTensor solution(3, 2, 4);
    state_type state = state_type::Zero(state_size(3));
    DensityMatrixView rho(state);
    rho(2, p_vc) = h_complex{ 1., -1. };
    rho(0, f_c) = 0.5;
    solution.store(1, 3, state);

    CHECK(solution(2, 1, 3, p_vc) == h_complex(1., -1.));
    CHECK(solution(0, 1, 3, f_c) == h_complex(0.5));
    CHECK(solution(2, 0, 3, p_vc) == h_complex{});

    const auto j = solution.to_json();
    CHECK(j["shape"][3] == 4);
    CHECK(j["solution_real"].size() == 3U * 2U * 4U * 4U);

    CHECK_THROWS_AS(solution.store(0, 0, state_type::Zero(5)), ConfigurationError);
    CHECK_THROWS_AS(SolutionTensor(0, 1, 1), ConfigurationError);
}
