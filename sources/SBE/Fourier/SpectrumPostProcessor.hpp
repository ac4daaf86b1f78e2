#pragma once

#include "../GlobalDefinitions.hpp"
#include "../TimeIntegrationConfig.hpp"
#include "../Laser/Laser.hpp"
#include "../Observables/EmissionCalculator.hpp"
#include "ComplexFFT.hpp"

#include <vector>
#include <nlohmann/json.hpp>

namespace SBE::Fourier {
    struct Spectrum {
        std::vector<h_float> frequencies; ///< centered, in a.u.
        std::vector<h_complex> transform_dir;
        std::vector<h_complex> transform_ortho;
        std::vector<h_float> intensity_dir;
        std::vector<h_float> intensity_ortho;

        /// Frequencies in units of the fundamental
        std::vector<h_float> harmonic_orders(h_float fundamental) const;
        nlohmann::json to_json(h_float fundamental) const;
    };

    /// |FFT| of the emission polarized at angle theta, I_dir cos(theta) - I_ort sin(theta)
    struct PolarEmission {
        std::vector<h_float> angles;
        std::vector<int> harmonic_orders;
        std::vector<std::vector<h_float>> amplitudes; ///< [order][angle]

        nlohmann::json to_json() const;
    };

    /**
     * Windows a series sampled on the output grid with the envelope of the pulse,
     * transforms it with orthonormal scaling and centers the zero frequency.
     * The DFT frequencies are f_i = (i - N/2) / (N dt_out).
     */
    class SpectrumPostProcessor {
    public:
        SpectrumPostProcessor(const TimeIntegrationConfig& time_config, const Laser::Laser& laser);

        std::vector<h_complex> transform(const std::vector<h_float>& series);
        /// freq^2 |transform|^2
        std::vector<h_float> intensity(const std::vector<h_complex>& transform) const;
        Spectrum compute(const Observables::DirectionalSeries& series);

        /**
         * @param fundamental driving frequency in a.u.
         * @return amplitudes at the frequency bin closest to every harmonic order 1, ..., max_order
         */
        PolarEmission polar_emission(const Observables::DirectionalSeries& series, h_float fundamental, 
            int n_angles = 360, int max_order = 20);

        inline const std::vector<h_float>& get_frequencies() const noexcept {
            return frequencies;
        }
        inline const std::vector<h_float>& get_window() const noexcept {
            return window;
        }
    private:
        const int N;
        std::vector<h_float> window;
        std::vector<h_float> frequencies;
        ComplexFFT fft;

        int closest_bin(h_float frequency) const;
    };
}
