#include "SpectrumPostProcessor.hpp"
#include "../Errors.hpp"

#include <algorithm>
#include <cmath>

namespace SBE::Fourier {
    std::vector<h_float> Spectrum::harmonic_orders(h_float fundamental) const
    {
        std::vector<h_float> orders(frequencies.size());
        std::transform(frequencies.begin(), frequencies.end(), orders.begin(), 
            [fundamental](h_float f) { return f / fundamental; });
        return orders;
    }

    nlohmann::json Spectrum::to_json(h_float fundamental) const
    {
        auto real_parts = [](const std::vector<h_complex>& z) {
            std::vector<h_float> ret(z.size());
            std::transform(z.begin(), z.end(), ret.begin(), [](const h_complex& x) { return x.real(); });
            return ret;
        };
        auto imag_parts = [](const std::vector<h_complex>& z) {
            std::vector<h_float> ret(z.size());
            std::transform(z.begin(), z.end(), ret.begin(), [](const h_complex& x) { return x.imag(); });
            return ret;
        };
        return {
            { "harmonic_orders", harmonic_orders(fundamental) },
            { "transform_dir_real", real_parts(transform_dir) },
            { "transform_dir_imag", imag_parts(transform_dir) },
            { "transform_ortho_real", real_parts(transform_ortho) },
            { "transform_ortho_imag", imag_parts(transform_ortho) },
            { "intensity_dir", intensity_dir },
            { "intensity_ortho", intensity_ortho }
        };
    }

    nlohmann::json PolarEmission::to_json() const
    {
        return {
            { "angles", angles },
            { "harmonic_orders", harmonic_orders },
            { "amplitudes", amplitudes }
        };
    }

    SpectrumPostProcessor::SpectrumPostProcessor(const TimeIntegrationConfig& time_config, const Laser::Laser& laser)
        : N{ time_config.n_samples() }, window(N), frequencies(N), fft(N)
    {
        const h_float dt_out = time_config.measure_every();
        if (!(dt_out > 0)) {
            throw ConfigurationError("The output grid must be increasing in time");
        }
        for (int i = 0; i < N; ++i) {
            window[i] = laser.envelope(time_config.time(i));
            frequencies[i] = (i - N / 2) / (N * dt_out);
        }
    }

    std::vector<h_complex> SpectrumPostProcessor::transform(const std::vector<h_float>& series)
    {
        if (static_cast<int>(series.size()) != N) {
            throw ConfigurationError("Expected " + std::to_string(N) + " samples but got " + std::to_string(series.size()));
        }
        std::vector<h_complex> windowed(N);
        std::transform(series.begin(), series.end(), window.begin(), windowed.begin(), 
            [](h_float x, h_float w) { return h_complex{ x * w }; });

        std::vector<h_complex> transformed;
        fft.compute(windowed, transformed);
        return ComplexFFT::shift_zero_to_center(transformed);
    }

    std::vector<h_float> SpectrumPostProcessor::intensity(const std::vector<h_complex>& transform) const
    {
        if (static_cast<int>(transform.size()) != N) {
            throw ConfigurationError("Expected a transform with " + std::to_string(N) + " frequencies");
        }
        std::vector<h_float> ret(N);
        for (int i = 0; i < N; ++i) {
            ret[i] = frequencies[i] * frequencies[i] * std::norm(transform[i]);
        }
        return ret;
    }

    Spectrum SpectrumPostProcessor::compute(const Observables::DirectionalSeries& series)
    {
        Spectrum spectrum;
        spectrum.frequencies = frequencies;
        spectrum.transform_dir = transform(series.E_dir);
        spectrum.transform_ortho = transform(series.ortho);
        spectrum.intensity_dir = intensity(spectrum.transform_dir);
        spectrum.intensity_ortho = intensity(spectrum.transform_ortho);
        return spectrum;
    }

    int SpectrumPostProcessor::closest_bin(h_float frequency) const
    {
        const auto it = std::min_element(frequencies.begin(), frequencies.end(), 
            [frequency](h_float lhs, h_float rhs) { return std::abs(lhs - frequency) < std::abs(rhs - frequency); });
        return static_cast<int>(std::distance(frequencies.begin(), it));
    }

    PolarEmission SpectrumPostProcessor::polar_emission(const Observables::DirectionalSeries& series, h_float fundamental, 
        int n_angles, int max_order)
    {
        if (n_angles < 2 || max_order < 1) {
            throw ConfigurationError("Polar emission needs at least two angles and one harmonic order");
        }
        if (series.E_dir.size() != series.ortho.size()) {
            throw ConfigurationError("Both polarization components must have the same length");
        }

        PolarEmission polar;
        polar.angles.resize(n_angles);
        for (int i = 0; i < n_angles; ++i) {
            polar.angles[i] = (2 * pi * i) / (n_angles - 1);
        }
        std::vector<int> bins(max_order);
        polar.harmonic_orders.resize(max_order);
        for (int n = 1; n <= max_order; ++n) {
            polar.harmonic_orders[n - 1] = n;
            bins[n - 1] = closest_bin(n * fundamental);
        }
        polar.amplitudes.assign(max_order, std::vector<h_float>(n_angles));

        std::vector<h_float> projected(series.E_dir.size());
        for (int i = 0; i < n_angles; ++i) {
            const h_float c = std::cos(polar.angles[i]);
            const h_float s = std::sin(-polar.angles[i]);
            std::transform(series.E_dir.begin(), series.E_dir.end(), series.ortho.begin(), projected.begin(),
                [c, s](h_float along, h_float ortho) { return along * c + ortho * s; });

            const std::vector<h_complex> transformed = transform(projected);
            for (int n = 0; n < max_order; ++n) {
                polar.amplitudes[n][i] = std::abs(transformed[bins[n]]);
            }
        }
        return polar;
    }
}
