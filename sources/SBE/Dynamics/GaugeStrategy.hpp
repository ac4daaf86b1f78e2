#pragma once

#include "../GlobalDefinitions.hpp"
#include "../Laser/Laser.hpp"
#include "../Mesh/KPath.hpp"
#include "../Systems/BandModel.hpp"
#include "DensityMatrix.hpp"
#include "PathCoefficients.hpp"

#include <Eigen/Sparse>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace SBE::Dynamics {
    enum class Gauge { Length, Velocity };

    Gauge gauge_from_string(const std::string& gauge);
    std::string to_string(Gauge gauge);

    struct Relaxation {
        h_float gamma1{}; ///< population damping 1 / T1
        h_float gamma2{}; ///< coherence damping 1 / T2
    };

    /**
     * Right-hand side of the semiconductor Bloch equations for a single path
     *   d f_v  / dt =  2 Im(w_R p_vc) - gamma1 (f_v - f_v0)
     *   d p_vc / dt = (i e_cv - gamma2 + i w_d) p_vc - i w_R^* (f_v - f_c)
     *   d p_cv / dt = (d p_vc / dt)^*
     *   d f_c  / dt = -2 Im(w_R p_vc) - gamma1 (f_c - f_c0)
     *   d A    / dt = -E(t)
     * with w_R = d_vc E(t) and w_d = (d_vv - d_cc) E(t).
     * The gauges differ in the coefficients they use and in the k-space gradient term.
     */
    class GaugeStrategy {
    public:
        using sparse_matrix = Eigen::SparseMatrix<h_complex>;

        GaugeStrategy(const Mesh::Path& _path, const Laser::Laser& _laser, PathCoefficients _coefficients,
            state_type _equilibrium, Relaxation _relaxation);
        virtual ~GaugeStrategy() = default;

        void rhs(const state_type& y, state_type& dydt, h_float t);
        /// Complex Jacobian d(dydt)/dy; the k-dependence of the coefficients on A is not included
        void jacobian(const state_type& y, sparse_matrix& J, h_float t);

        virtual bool has_gradient_term() const noexcept = 0;
        virtual std::string_view name() const noexcept = 0;

        inline const PathCoefficients& current_coefficients() const noexcept {
            return coefficients;
        }
        inline const state_type& equilibrium_state() const noexcept {
            return equilibrium;
        }
    protected:
        const Mesh::Path& path;
        const Laser::Laser& laser;
        PathCoefficients coefficients;

        /// Called before every evaluation with the current vector potential
        virtual void update_coefficients(h_float vector_potential, h_float t) = 0;
        /// Prefactor D of D (y[k+1] - y[k-1]); only called if has_gradient_term()
        virtual h_float gradient_prefactor(h_float electric_field) const;
    private:
        const state_type equilibrium;
        const Relaxation relaxation;
        std::vector<Eigen::Triplet<h_complex>> triplets;

        void check_state(const state_type& y, h_float t) const;
    };

    /// Fixed k-grid, coupling via the finite-difference gradient D = E(t) / (2 dk)
    class LengthGauge : public GaugeStrategy {
    public:
        LengthGauge(const Mesh::Path& _path, const Laser::Laser& _laser, PathCoefficients _coefficients,
            state_type _equilibrium, Relaxation _relaxation);

        inline bool has_gradient_term() const noexcept final { return true; }
        inline std::string_view name() const noexcept final { return "length"; }
    protected:
        void update_coefficients(h_float vector_potential, h_float t) final;
        h_float gradient_prefactor(h_float electric_field) const final;
    };

    /// Coefficients are reevaluated at k + A(t) E_dir, no gradient term
    class VelocityGauge : public GaugeStrategy {
    public:
        /// _coefficients must be evaluated at A = 0
        VelocityGauge(const Mesh::Path& _path, const Laser::Laser& _laser, const Systems::BandModel& _model,
            const real_vector<2>& _E_dir, bool _dipole_off, PathCoefficients _coefficients, 
            state_type _equilibrium, Relaxation _relaxation);

        inline bool has_gradient_term() const noexcept final { return false; }
        inline std::string_view name() const noexcept final { return "velocity"; }
    protected:
        void update_coefficients(h_float vector_potential, h_float t) final;
    private:
        const Systems::BandModel& model;
        const real_vector<2> E_dir;
        const bool dipole_off{};
        h_float cached_vector_potential{};
    };

    /**
     * Sets up the gauge for one path, starting from the equilibrium at the unshifted k-points.
     */
    std::unique_ptr<GaugeStrategy> make_gauge_strategy(Gauge gauge, const Mesh::Path& path, const Laser::Laser& laser,
        const Systems::BandModel& model, const real_vector<2>& E_dir, bool dipole_off, 
        h_float e_fermi, h_float temperature, Relaxation relaxation);
}
