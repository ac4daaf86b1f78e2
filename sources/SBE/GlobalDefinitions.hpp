#pragma once
#define _USE_MATH_DEFINES

#include <Eigen/Dense>
#include <cmath>
#include <complex>
#include <limits>

namespace SBE {
    using h_float = double;
    using h_complex = std::complex<h_float>;

    template<Eigen::Index nrows, Eigen::Index ncols> using real_matrix = Eigen::Matrix<h_float, nrows, ncols>;
    template<Eigen::Index nrows> using real_vector = Eigen::Vector<h_float, nrows>;

    using nd_vector = real_vector<Eigen::Dynamic>;

    template<Eigen::Index nrows, Eigen::Index ncols> using complex_matrix = Eigen::Matrix<h_complex, nrows, ncols>;
    template<Eigen::Index nrows> using complex_vector = Eigen::Vector<h_complex, nrows>;

    using nd_complex_vector = complex_vector<Eigen::Dynamic>;

    constexpr h_complex imaginary_unit{0., 1.};
    constexpr h_float pi      = h_float(M_PI); // pi
    constexpr h_float sqrt_3  = h_float(1.732050807568877293527446341); // sqrt(3)

    // Conversion factors to atomic units
    constexpr h_float fs_to_au    = h_float(41.34137335);        // 1 fs    = 41.34137335 a.u.
    constexpr h_float MVpcm_to_au = h_float(0.0001944690381);    // 1 MV/cm = 1.944690381e-4 a.u.
    constexpr h_float THz_to_au   = h_float(0.000024188843266);  // 1 THz   = 2.4188843266e-5 a.u.
    constexpr h_float A_to_au     = h_float(150.97488474);       // 1 A     = 150.97488474 a.u.
    constexpr h_float eV_to_au    = h_float(0.03674932176);      // 1 eV    = 0.03674932176 a.u.

    // Below this temperature (a.u.) occupations are step functions
    constexpr h_float temperature_threshold = h_float(1e-5);

    /**
     * @param energy measured from the chemical potential, in a.u.
     * @param temperature k_B T in a.u.
     */
    inline h_float fermi_function(h_float energy, h_float temperature) noexcept {
        if (temperature <= temperature_threshold) {
            return (energy < 0 ? h_float{1} : h_float{});
        }
        return 1. / (1. + std::exp(energy / temperature));
    }

    template<class... Args>
    h_float norm(Args... args) {
        return std::sqrt((... + (args * args)));
    }

    inline bool is_finite(h_complex number) noexcept {
        return std::isfinite(number.real()) && std::isfinite(number.imag());
    }
}
