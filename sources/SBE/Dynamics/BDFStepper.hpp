#pragma once

#include "../GlobalDefinitions.hpp"
#include "../Errors.hpp"
#include "DensityMatrix.hpp"

#include <Eigen/Sparse>
#include <Eigen/SparseLU>
#include <boost/numeric/odeint/stepper/stepper_categories.hpp>
#include <boost/numeric/odeint/util/unwrap_reference.hpp>
#include <limits>

namespace SBE::Dynamics {
    struct BDFSettings {
        h_float abs_tol{ 1e-10 };       ///< Newton convergence |delta|_inf <= abs_tol + rel_tol |y|_inf
        h_float rel_tol{ 1e-8 };
        int max_newton_iterations{ 8 };
        int max_halvings{ 10 };         ///< the smallest internal step is dt / 2^max_halvings
    };

    /**
     * Implicit BDF stepper for odeint (stepper_tag).
     * The system is a std::pair of the right-hand side f(y, dydt, t) and its Jacobian J(y, J, t),
     * the same convention as boost::numeric::odeint::implicit_euler.
     * 
     * The first step after construction or reset() is a backward Euler step, all further steps use
     * the variable-coefficient BDF2 formula
     *   y_{n+1} - (1+w)^2/(1+2w) y_n + w^2/(1+2w) y_{n-1} = h (1+w)/(1+2w) f(t_{n+1}, y_{n+1}),   w = h_n / h_{n-1}
     * solved by a simplified Newton iteration with one sparse LU factorization per step.
     * If the iteration fails, the step is split into two halves. After max_halvings splits the
     * stepper throws IntegrationFailure; the internal step never exceeds the requested dt.
     * 
     * Pass the stepper with boost::ref to odeint, it carries the step history.
     */
    class BDFStepper {
    public:
        typedef Dynamics::state_type state_type;
        typedef state_type deriv_type;
        typedef h_complex value_type;
        typedef h_float time_type;
        typedef Eigen::SparseMatrix<h_complex> matrix_type;
        typedef boost::numeric::odeint::stepper_tag stepper_category;
        typedef unsigned short order_type;

        static constexpr order_type order_value = 2;

        explicit BDFStepper(const BDFSettings& _settings = BDFSettings{});

        template<class System>
        void do_step(System system, state_type& x, time_type t, time_type dt)
        {
            typedef typename boost::numeric::odeint::unwrap_reference<System>::type system_type;
            typedef typename boost::numeric::odeint::unwrap_reference<typename system_type::first_type>::type deriv_func_type;
            typedef typename boost::numeric::odeint::unwrap_reference<typename system_type::second_type>::type jacobi_func_type;
            system_type& sys = system;
            deriv_func_type& deriv_func = sys.first;
            jacobi_func_type& jacobi_func = sys.second;

            advance(deriv_func, jacobi_func, x, t, dt, 0);
        }

        /// Forget the step history, the next step is a backward Euler step
        void reset() noexcept;

        inline order_type order() const noexcept {
            return has_history ? order_value : 1;
        }
        inline long rejected_steps() const noexcept {
            return n_rejected;
        }
    private:
        const BDFSettings settings;

        bool has_history{};
        state_type previous;
        time_type previous_step{};
        long n_rejected{};

        state_type psi;
        state_type y;
        state_type dxdt;
        state_type residual;
        state_type delta;
        matrix_type jacobi;
        matrix_type identity;
        matrix_type iteration_matrix;
        Eigen::SparseLU<matrix_type, Eigen::COLAMDOrdering<int>> solver;
        Eigen::Index analyzed_nonzeros{ -1 };

        bool factorize(time_type h_beta);

        template<class DerivFunc, class JacobiFunc>
        void advance(DerivFunc& deriv_func, JacobiFunc& jacobi_func, state_type& x, time_type t, time_type h, int depth)
        {
            if (try_step(deriv_func, jacobi_func, x, t, h)) return;
            ++n_rejected;
            if (depth >= settings.max_halvings) {
                throw IntegrationFailure("Newton iteration did not converge with the internal step size " + std::to_string(h), t);
            }
            advance(deriv_func, jacobi_func, x, t, 0.5 * h, depth + 1);
            advance(deriv_func, jacobi_func, x, t + 0.5 * h, 0.5 * h, depth + 1);
        }

        // Leaves x and the history untouched if the step is rejected
        template<class DerivFunc, class JacobiFunc>
        bool try_step(DerivFunc& deriv_func, JacobiFunc& jacobi_func, state_type& x, time_type t, time_type h)
        {
            const time_type t_new = t + h;
            h_float beta{ 1 };
            if (has_history) {
                const h_float omega = h / previous_step;
                const h_float denominator = 1. + 2. * omega;
                psi = ((1. + omega) * (1. + omega) / denominator) * x - (omega * omega / denominator) * previous;
                beta = (1. + omega) / denominator;
                y = x + omega * (x - previous);
            }
            else {
                psi = x;
                y = x;
            }

            jacobi_func(y, jacobi, t_new);
            if (!factorize(h * beta)) return false;

            h_float previous_norm = std::numeric_limits<h_float>::infinity();
            for (int i = 0; i < settings.max_newton_iterations; ++i) {
                deriv_func(y, dxdt, t_new);
                residual = y - psi - (h * beta) * dxdt;
                delta = solver.solve(residual);
                if (solver.info() != Eigen::Success || !delta.allFinite()) return false;
                y -= delta;

                const h_float delta_norm = delta.lpNorm<Eigen::Infinity>();
                if (delta_norm <= settings.abs_tol + settings.rel_tol * y.lpNorm<Eigen::Infinity>()) {
                    previous = x;
                    previous_step = h;
                    has_history = true;
                    x = y;
                    return true;
                }
                if (delta_norm > 2. * previous_norm) return false;
                previous_norm = delta_norm;
            }
            return false;
        }
    };
}
