#include <catch2/catch.hpp>

#include "SBE/Dynamics/GaugeStrategy.hpp"
#include "SBE/Laser/ChirpedGaussLaser.hpp"
#include "SBE/Systems/BiTe.hpp"
#include "SBE/Errors.hpp"

using namespace SBE;
using namespace SBE::Dynamics;

namespace {
    const h_float lattice_constant = 8.308;
    const h_float e_fermi = 0.2 * eV_to_au;
    const h_float temperature = 0.03 * eV_to_au;
    const Relaxation relaxation{ 1. / (10. * fs_to_au), 1. / fs_to_au };

    // equilibrium with coherences p_cv = conj(p_vc) and slightly perturbed populations
    state_type perturbed_state(const state_type& equilibrium) {
        state_type y = equilibrium;
        DensityMatrixView rho(y);
        for (int k = 0; k < rho.size(); ++k) {
            const h_complex p{ 0.01 * std::cos(0.7 * k), 0.02 * std::sin(1.3 * k) };
            rho(k, p_vc) = p;
            rho(k, p_cv) = std::conj(p);
            rho(k, f_v) -= 0.001 * (k % 3);
            rho(k, f_c) += 0.001 * (k % 3);
        }
        rho.vector_potential() = 0.02;
        return y;
    }

    // Variations with p_cv = conj(p_vc) and real populations, the class of states the Jacobian is built for
    state_type physical_direction(int n_k) {
        state_type v = state_type::Zero(state_size(n_k));
        DensityMatrixView dv(v);
        for (int k = 0; k < n_k; ++k) {
            const h_complex z{ std::sin(0.3 * k + 0.1), std::cos(0.9 * k) };
            dv(k, p_vc) = z;
            dv(k, p_cv) = std::conj(z);
            dv(k, f_v) = std::cos(0.5 * k);
            dv(k, f_c) = std::sin(0.2 * k);
        }
        return v;
    }

    void check_jacobian(GaugeStrategy& gauge, const state_type& y, h_float t) {
        GaugeStrategy::sparse_matrix J;
        gauge.jacobian(y, J, t);
        REQUIRE(J.rows() == y.size());

        const state_type v = physical_direction((y.size() - 1) / n_components);
        const h_float eps = 1e-6;
        state_type f_plus, f_minus;
        const state_type y_plus = y + eps * v;
        const state_type y_minus = y - eps * v;
        gauge.rhs(y_plus, f_plus, t);
        gauge.rhs(y_minus, f_minus, t);

        const state_type numerical = (f_plus - f_minus) / (2. * eps);
        const state_type analytical = J * v;
        CHECK((numerical - analytical).lpNorm<Eigen::Infinity>() < 1e-6 * (1. + analytical.lpNorm<Eigen::Infinity>()));
    }
}

TEST_CASE("Gauge strategies", "[dynamics]") {
    const Systems::BiTe model(0., 0., 0.1974, 11.06);
    const Mesh::KMesh mesh = Mesh::two_line_mesh(12, 0.05, 5. * pi / lattice_constant, lattice_constant, 0.);
    const Mesh::Path& path = mesh.paths.front();

    const Laser::ChirpedGaussLaser no_field(0., 25. * THz_to_au, 0., 25. * fs_to_au, 0.);
    // E(0) = E0
    const Laser::ChirpedGaussLaser laser(5. * MVpcm_to_au, 25. * THz_to_au, 0., 25. * fs_to_au, 0.5 * pi);

    SECTION("gauge parsing") {
        CHECK(gauge_from_string("length") == Gauge::Length);
        CHECK(gauge_from_string("velocity") == Gauge::Velocity);
        CHECK(to_string(Gauge::Velocity) == "velocity");
        CHECK_THROWS_AS(gauge_from_string("coulomb"), ConfigurationError);
    }

    SECTION("equilibrium is a fixed point without field") {
        for (const Gauge g : { Gauge::Length, Gauge::Velocity }) {
            auto gauge = make_gauge_strategy(g, path, no_field, model, mesh.E_dir, false, e_fermi, temperature, relaxation);
            state_type dydt;
            gauge->rhs(gauge->equilibrium_state(), dydt, 13.);
            CHECK(dydt.lpNorm<Eigen::Infinity>() == 0.);
        }
    }

    SECTION("vector potential follows the field") {
        auto gauge = make_gauge_strategy(Gauge::Length, path, laser, model, mesh.E_dir, false, e_fermi, temperature, relaxation);
        state_type dydt;
        gauge->rhs(gauge->equilibrium_state(), dydt, 0.);
        CHECK(dydt(dydt.size() - 1).real() == Approx(-laser.electric_field(0.)));
    }

    SECTION("p_cv evolves as the conjugate of p_vc") {
        for (const Gauge g : { Gauge::Length, Gauge::Velocity }) {
            auto gauge = make_gauge_strategy(g, path, laser, model, mesh.E_dir, false, e_fermi, temperature, relaxation);
            state_type dydt;
            gauge->rhs(perturbed_state(gauge->equilibrium_state()), dydt, 0.);
            ConstDensityMatrixView drho(dydt);
            for (int k = 0; k < drho.size(); ++k) {
                CHECK(drho(k, p_cv) == std::conj(drho(k, p_vc)));
                CHECK(drho(k, f_v).imag() == Approx(0.).margin(1e-14));
            }
        }
    }

    SECTION("Jacobian matches finite differences in the length gauge") {
        auto gauge = make_gauge_strategy(Gauge::Length, path, laser, model, mesh.E_dir, false, e_fermi, temperature, relaxation);
        check_jacobian(*gauge, perturbed_state(gauge->equilibrium_state()), 0.);
    }

    SECTION("Jacobian matches finite differences in the velocity gauge") {
        auto gauge = make_gauge_strategy(Gauge::Velocity, path, laser, model, mesh.E_dir, false, e_fermi, temperature, relaxation);
        CHECK_FALSE(gauge->has_gradient_term());
        // the variations leave A untouched, the coefficients stay fixed
        check_jacobian(*gauge, perturbed_state(gauge->equilibrium_state()), 0.);
    }

    SECTION("velocity gauge reevaluates the coefficients at k + A") {
        auto gauge = make_gauge_strategy(Gauge::Velocity, path, laser, model, mesh.E_dir, false, e_fermi, temperature, relaxation);
        state_type y = gauge->equilibrium_state();
        y(y.size() - 1) = 0.05;
        state_type dydt;
        gauge->rhs(y, dydt, 0.);

        const PathCoefficients expected = PathCoefficients::evaluate(model, path.kx(0.05, mesh.E_dir), path.ky(0.05, mesh.E_dir), 
            mesh.E_dir, false);
        for (int k = 0; k < path.size(); ++k) {
            CHECK(gauge->current_coefficients().ecv(k) == Approx(expected.ecv(k)));
        }
    }

    SECTION("dipole_off removes the interband coupling") {
        auto gauge = make_gauge_strategy(Gauge::Length, path, laser, model, mesh.E_dir, true, e_fermi, temperature, relaxation);
        CHECK(gauge->current_coefficients().dipole.isZero());
        CHECK(gauge->current_coefficients().diag_dipole.isZero());
    }

    SECTION("single k-point path") {
        const Mesh::KMesh single = Mesh::two_line_mesh(1, 0.05, 5. * pi / lattice_constant, lattice_constant, 0.);
        const Relaxation no_relaxation{};
        auto gauge = make_gauge_strategy(Gauge::Length, single.paths.front(), laser, model, single.E_dir, false, 
            e_fermi, temperature, no_relaxation);
        const state_type y = perturbed_state(gauge->equilibrium_state());
        state_type dydt;
        REQUIRE_NOTHROW(gauge->rhs(y, dydt, 0.));

        // the gradient term of a point with itself as neighbour vanishes
        const PathCoefficients& c = gauge->current_coefficients();
        const h_float E = laser.electric_field(0.);
        ConstDensityMatrixView rho(y);
        const h_complex expected = (imaginary_unit * c.ecv(0) + imaginary_unit * c.diag_dipole(0) * E) * rho(0, p_vc)
            - imaginary_unit * std::conj(c.dipole(0) * E) * (rho(0, f_v) - rho(0, f_c));
        CHECK(std::abs(dydt(1) - expected) < 1e-14 * (1. + std::abs(expected)));
        check_jacobian(*gauge, y, 0.);
    }

    SECTION("invalid states") {
        auto gauge = make_gauge_strategy(Gauge::Length, path, laser, model, mesh.E_dir, false, e_fermi, temperature, relaxation);
        state_type dydt;
        CHECK_THROWS_AS(gauge->rhs(state_type::Zero(5), dydt, 0.), ConfigurationError);

        state_type y = gauge->equilibrium_state();
        y(4) = std::numeric_limits<h_float>::quiet_NaN();
        CHECK_THROWS_AS(gauge->rhs(y, dydt, 0.), NumericalDomainError);
    }

    SECTION("length gauge needs a k-spacing") {
        Mesh::Path degenerate = path;
        degenerate.dk = 0.;
        CHECK_THROWS_AS(make_gauge_strategy(Gauge::Length, degenerate, laser, model, mesh.E_dir, false, 
            e_fermi, temperature, relaxation), ConfigurationError);
    }
}
