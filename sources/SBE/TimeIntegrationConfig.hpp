#pragma once

#include "GlobalDefinitions.hpp"
#include <iostream>

namespace SBE {
    /**
     * Output grid of the time propagation.
     * Samples are taken at t_begin + i * measure_every() for i = 0, ..., n_measurements,
     * the integrator performs n_subdivisions steps between two samples.
     */
    struct TimeIntegrationConfig {
        h_float t_begin{};
        h_float t_end{};
        int n_measurements{};
        int n_subdivisions{};

        h_float dt() const;
        h_float measure_every() const;

        inline int n_samples() const noexcept {
            return n_measurements + 1;
        }
        inline h_float time(int i) const {
            return t_begin + i * measure_every();
        }

        /**
         * Symmetric window around t = 0 holding exactly n_samples output samples.
         * The stride is the smallest integer such that stride * n_samples steps of size dt cover 2 * half_window.
         * 
         * @param half_window |t0|, the pulse is centered at t = 0
         * @param dt integrator step size
         */
        static TimeIntegrationConfig centered(h_float half_window, h_float dt, int n_samples);
    };

    std::ostream& operator<<(std::ostream& os, TimeIntegrationConfig const& tconfig);
}
