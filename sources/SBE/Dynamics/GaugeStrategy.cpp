#include "GaugeStrategy.hpp"
#include "../Errors.hpp"

namespace SBE::Dynamics {
    Gauge gauge_from_string(const std::string& gauge)
    {
        if (gauge == "length") return Gauge::Length;
        if (gauge == "velocity") return Gauge::Velocity;
        throw ConfigurationError("Gauge '" + gauge + "' is not recognized! Use 'length' or 'velocity'.");
    }

    std::string to_string(Gauge gauge)
    {
        return gauge == Gauge::Length ? "length" : "velocity";
    }

    GaugeStrategy::GaugeStrategy(const Mesh::Path& _path, const Laser::Laser& _laser, PathCoefficients _coefficients,
        state_type _equilibrium, Relaxation _relaxation)
        : path(_path), laser(_laser), coefficients(std::move(_coefficients)), 
        equilibrium(std::move(_equilibrium)), relaxation(_relaxation)
    {
        if (coefficients.size() != path.size()) {
            throw ConfigurationError("The path has " + std::to_string(path.size()) + " k-points but " 
                + std::to_string(coefficients.size()) + " coefficients were provided");
        }
        check_state_layout(equilibrium, path.size());
        triplets.reserve(20 * path.size());
    }

    h_float GaugeStrategy::gradient_prefactor(h_float /* electric_field */) const
    {
        return h_float{};
    }

    void GaugeStrategy::check_state(const state_type& y, h_float t) const
    {
        if (y.size() != equilibrium.size()) {
            throw ConfigurationError("State vector of size " + std::to_string(y.size()) 
                + " does not match a path with " + std::to_string(path.size()) + " k-points");
        }
        ConstDensityMatrixView rho(y);
        for (int k = 0; k < rho.size(); ++k) {
            if (!is_finite(rho(k, f_v)) || !is_finite(rho(k, p_vc)) || !is_finite(rho(k, p_cv)) || !is_finite(rho(k, f_c))) {
                throw NumericalDomainError("Density matrix is not finite", path.points[k].x, path.points[k].y, t);
            }
        }
    }

    void GaugeStrategy::rhs(const state_type& y, state_type& dydt, h_float t)
    {
        check_state(y, t);
        update_coefficients(y(y.size() - 1).real(), t);

        const h_float electric_field = laser.electric_field(t);
        const bool gradient = has_gradient_term();
        const h_float D = gradient ? gradient_prefactor(electric_field) : h_float{};

        dydt.resize(y.size());
        ConstDensityMatrixView rho(y);
        ConstDensityMatrixView rho_0(equilibrium);
        DensityMatrixView drho(dydt);

        for (int k = 0; k < rho.size(); ++k) {
            const h_complex wr = coefficients.dipole(k) * electric_field;
            const h_complex wr_c = std::conj(wr);
            const h_complex wr_diag = coefficients.diag_dipole(k) * electric_field;
            const h_float transfer = 2. * (wr * rho(k, p_vc)).imag();

            drho(k, f_v) = transfer - relaxation.gamma1 * (rho(k, f_v) - rho_0(k, f_v));
            drho(k, p_vc) = (imaginary_unit * coefficients.ecv(k) - relaxation.gamma2 + imaginary_unit * wr_diag) * rho(k, p_vc)
                - imaginary_unit * wr_c * (rho(k, f_v) - rho(k, f_c));
            drho(k, f_c) = -transfer - relaxation.gamma1 * (rho(k, f_c) - rho_0(k, f_c));

            if (gradient) {
                const int m = rho.next(k);
                const int n = rho.previous(k);
                drho(k, f_v) += D * (rho(m, f_v) - rho(n, f_v));
                drho(k, p_vc) += D * (rho(m, p_vc) - rho(n, p_vc));
                drho(k, f_c) += D * (rho(m, f_c) - rho(n, f_c));
            }
            drho(k, p_cv) = std::conj(drho(k, p_vc));
        }
        drho.vector_potential() = -electric_field;
    }

    void GaugeStrategy::jacobian(const state_type& y, sparse_matrix& J, h_float t)
    {
        check_state(y, t);
        update_coefficients(y(y.size() - 1).real(), t);

        const h_float electric_field = laser.electric_field(t);
        const bool gradient = has_gradient_term();
        const h_float D = gradient ? gradient_prefactor(electric_field) : h_float{};

        ConstDensityMatrixView rho(y);
        triplets.clear();
        auto add = [this, &rho](int k_row, Component c_row, int k_col, Component c_col, h_complex value) {
            triplets.emplace_back(rho.index(k_row, c_row), rho.index(k_col, c_col), value);
        };

        for (int k = 0; k < rho.size(); ++k) {
            const h_complex wr = coefficients.dipole(k) * electric_field;
            const h_complex wr_c = std::conj(wr);
            const h_complex wr_diag = coefficients.diag_dipole(k) * electric_field;

            // 2 Im(w_R p_vc) = -i w_R p_vc + i w_R^* p_cv
            add(k, f_v, k, f_v, -relaxation.gamma1);
            add(k, f_v, k, p_vc, -imaginary_unit * wr);
            add(k, f_v, k, p_cv, imaginary_unit * wr_c);

            add(k, p_vc, k, p_vc, imaginary_unit * coefficients.ecv(k) - relaxation.gamma2 + imaginary_unit * wr_diag);
            add(k, p_vc, k, f_v, -imaginary_unit * wr_c);
            add(k, p_vc, k, f_c, imaginary_unit * wr_c);

            add(k, p_cv, k, p_cv, -imaginary_unit * coefficients.ecv(k) - relaxation.gamma2 - imaginary_unit * std::conj(wr_diag));
            add(k, p_cv, k, f_v, imaginary_unit * wr);
            add(k, p_cv, k, f_c, -imaginary_unit * wr);

            add(k, f_c, k, f_c, -relaxation.gamma1);
            add(k, f_c, k, p_vc, imaginary_unit * wr);
            add(k, f_c, k, p_cv, -imaginary_unit * wr_c);

            if (gradient) {
                const int m = rho.next(k);
                const int n = rho.previous(k);
                for (const Component c : { f_v, p_vc, p_cv, f_c }) {
                    add(k, c, m, c, D);
                    add(k, c, n, c, -D);
                }
            }
        }
        // The row of A vanishes, dA/dt only depends on t
        J.resize(y.size(), y.size());
        J.setFromTriplets(triplets.begin(), triplets.end());
    }

    LengthGauge::LengthGauge(const Mesh::Path& _path, const Laser::Laser& _laser, PathCoefficients _coefficients,
        state_type _equilibrium, Relaxation _relaxation)
        : GaugeStrategy(_path, _laser, std::move(_coefficients), std::move(_equilibrium), _relaxation)
    {
        if (!(path.dk > 0)) {
            throw ConfigurationError("The length gauge requires a positive k-spacing, got dk=" + std::to_string(path.dk));
        }
    }

    void LengthGauge::update_coefficients(h_float /* vector_potential */, h_float /* t */)
    { }

    h_float LengthGauge::gradient_prefactor(h_float electric_field) const
    {
        return electric_field / (2. * path.dk);
    }

    VelocityGauge::VelocityGauge(const Mesh::Path& _path, const Laser::Laser& _laser, const Systems::BandModel& _model,
        const real_vector<2>& _E_dir, bool _dipole_off, PathCoefficients _coefficients, 
        state_type _equilibrium, Relaxation _relaxation)
        : GaugeStrategy(_path, _laser, std::move(_coefficients), std::move(_equilibrium), _relaxation),
        model(_model), E_dir(_E_dir), dipole_off{_dipole_off}
    { }

    void VelocityGauge::update_coefficients(h_float vector_potential, h_float t)
    {
        if (vector_potential == cached_vector_potential) return;
        try {
            coefficients = PathCoefficients::evaluate(model, path.kx(vector_potential, E_dir), path.ky(vector_potential, E_dir), 
                E_dir, dipole_off);
        }
        catch (const NumericalDomainError& e) {
            throw NumericalDomainError("Band model failed at the shifted momentum", e.kx, e.ky, t);
        }
        cached_vector_potential = vector_potential;
    }

    std::unique_ptr<GaugeStrategy> make_gauge_strategy(Gauge gauge, const Mesh::Path& path, const Laser::Laser& laser,
        const Systems::BandModel& model, const real_vector<2>& E_dir, bool dipole_off, 
        h_float e_fermi, h_float temperature, Relaxation relaxation)
    {
        if (path.size() < 1) {
            throw ConfigurationError("Cannot propagate a path without k-points");
        }
        PathCoefficients coefficients = PathCoefficients::evaluate(model, path.kx(), path.ky(), E_dir, dipole_off);
        state_type equilibrium = initial_condition(coefficients.e_c, e_fermi, temperature);

        if (gauge == Gauge::Length) {
            return std::make_unique<LengthGauge>(path, laser, std::move(coefficients), std::move(equilibrium), relaxation);
        }
        return std::make_unique<VelocityGauge>(path, laser, model, E_dir, dipole_off, std::move(coefficients), 
            std::move(equilibrium), relaxation);
    }
}
