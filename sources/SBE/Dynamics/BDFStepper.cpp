#include "BDFStepper.hpp"

namespace SBE::Dynamics {
    BDFStepper::BDFStepper(const BDFSettings& _settings)
        : settings(_settings)
    {
        if (settings.max_newton_iterations < 1 || settings.max_halvings < 0 || !(settings.abs_tol > 0) || settings.rel_tol < 0) {
            throw ConfigurationError("Invalid BDF settings");
        }
    }

    void BDFStepper::reset() noexcept
    {
        has_history = false;
        previous_step = time_type{};
        n_rejected = 0;
    }

    bool BDFStepper::factorize(time_type h_beta)
    {
        if (identity.rows() != jacobi.rows()) {
            identity.resize(jacobi.rows(), jacobi.cols());
            identity.setIdentity();
            analyzed_nonzeros = -1;
        }
        // M = 1 - h beta J, the sparsity pattern only changes with the system
        iteration_matrix = identity - h_complex{ h_beta } * jacobi;
        iteration_matrix.makeCompressed();
        if (iteration_matrix.nonZeros() != analyzed_nonzeros) {
            solver.analyzePattern(iteration_matrix);
            analyzed_nonzeros = iteration_matrix.nonZeros();
        }
        solver.factorize(iteration_matrix);
        return solver.info() == Eigen::Success;
    }
}
