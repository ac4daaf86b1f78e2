#include <catch2/catch.hpp>

#include "SBE/Fourier/SpectrumPostProcessor.hpp"
#include "SBE/Laser/ChirpedGaussLaser.hpp"
#include "SBE/Errors.hpp"

#include <algorithm>
#include <numeric>

using namespace SBE;
using namespace SBE::Fourier;

TEST_CASE("Orthonormal FFT", "[fourier]") {
    const int N = 16;
    ComplexFFT fft(N);

    SECTION("delta") {
        std::vector<h_complex> delta(N);
        delta[0] = 1.;
        std::vector<h_float> re, im;
        fft.compute(delta, re, im);
        for (int i = 0; i < N; ++i) {
            CHECK(re[i] == Approx(0.25));
            CHECK(im[i] == Approx(0.).margin(1e-14));
        }
    }

    SECTION("constant") {
        std::vector<h_complex> constant(N, h_complex{ 1. });
        std::vector<h_complex> transformed;
        fft.compute(constant, transformed);
        CHECK(transformed[0].real() == Approx(4.));
        for (int i = 1; i < N; ++i) {
            CHECK(std::abs(transformed[i]) < 1e-13);
        }
    }

    SECTION("Parseval") {
        std::vector<h_complex> signal(N);
        for (int i = 0; i < N; ++i) {
            signal[i] = h_complex{ std::sin(0.3 * i * i), 0.1 * i };
        }
        std::vector<h_complex> transformed;
        fft.compute(signal, transformed);
        auto energy = [](const std::vector<h_complex>& x) {
            return std::accumulate(x.begin(), x.end(), h_float{}, [](h_float sum, const h_complex& z) { return sum + std::norm(z); });
        };
        CHECK(energy(transformed) == Approx(energy(signal)));
    }

    SECTION("invalid sizes") {
        std::vector<h_complex> transformed;
        CHECK_THROWS_AS(fft.compute(std::vector<h_complex>(N - 1), transformed), ConfigurationError);
        CHECK_THROWS_AS(ComplexFFT(0), ConfigurationError);
    }

    SECTION("zero frequency to center") {
        const std::vector<int> even_expected{ 2, 3, 0, 1 };
        const std::vector<int> odd_expected{ 3, 4, 0, 1, 2 };
        CHECK(ComplexFFT::shift_zero_to_center(std::vector<int>{ 0, 1, 2, 3 }) == even_expected);
        CHECK(ComplexFFT::shift_zero_to_center(std::vector<int>{ 0, 1, 2, 3, 4 }) == odd_expected);
    }
}

TEST_CASE("Spectrum post processing", "[fourier]") {
    // 1024 samples with unit spacing, centered around t = 0
    const TimeIntegrationConfig time_config{ -512., 511., 1023, 1 };
    const Laser::ChirpedGaussLaser laser(1., 0.1, 0., 100., 0.);
    SpectrumPostProcessor processor(time_config, laser);
    const int N = time_config.n_samples();

    SECTION("grid and window") {
        const auto& f = processor.get_frequencies();
        REQUIRE(static_cast<int>(f.size()) == N);
        CHECK(f[N / 2] == 0.);
        CHECK(f[N / 2 + 1] == Approx(1. / 1024.));
        CHECK(f.front() == Approx(-0.5));
        CHECK(processor.get_window()[512] == Approx(1.));
        CHECK(processor.get_window()[0] == Approx(laser.envelope(-512.)));
    }

    SECTION("pure tone") {
        const h_float f0 = 0.1;
        Observables::DirectionalSeries series(N);
        for (int i = 0; i < N; ++i) {
            series.E_dir[i] = std::cos(2 * pi * f0 * time_config.time(i));
        }
        const Spectrum spectrum = processor.compute(series);
        REQUIRE(static_cast<int>(spectrum.intensity_dir.size()) == N);

        const auto peak = std::max_element(spectrum.intensity_dir.begin() + N / 2, spectrum.intensity_dir.end());
        const h_float peak_frequency = spectrum.frequencies[std::distance(spectrum.intensity_dir.begin(), peak)];
        CHECK(std::abs(peak_frequency - f0) <= 1. / 1024.);

        for (int i = 0; i < N; ++i) {
            CHECK(spectrum.intensity_dir[i] == Approx(spectrum.frequencies[i] * spectrum.frequencies[i] 
                * std::norm(spectrum.transform_dir[i])));
            CHECK(spectrum.intensity_ortho[i] == 0.);
        }
        const auto orders = spectrum.harmonic_orders(f0);
        CHECK(orders[N / 2 + 1] == Approx(1. / (1024. * f0)));

        const auto j = spectrum.to_json(f0);
        CHECK(j["intensity_dir"].size() == static_cast<size_t>(N));
    }

    SECTION("polar emission of a linearly polarized signal") {
        const h_float w = 0.01;
        Observables::DirectionalSeries series(N);
        for (int i = 0; i < N; ++i) {
            series.E_dir[i] = std::cos(2 * pi * w * time_config.time(i));
        }
        const PolarEmission polar = processor.polar_emission(series, w);
        REQUIRE(polar.angles.size() == 360U);
        REQUIRE(polar.amplitudes.size() == 20U);
        CHECK(polar.angles.front() == 0.);
        CHECK(polar.angles.back() == Approx(2 * pi));
        CHECK(polar.harmonic_orders.front() == 1);
        CHECK(polar.harmonic_orders.back() == 20);

        const h_float reference = polar.amplitudes[0][0];
        CHECK(reference > 1.);
        for (size_t i = 0U; i < polar.angles.size(); i += 7U) {
            CHECK(polar.amplitudes[0][i] == Approx(std::abs(std::cos(polar.angles[i])) * reference).margin(1e-9 * reference));
        }
        // the third harmonic is absent from a pure tone
        CHECK(polar.amplitudes[2][0] < 1e-3 * reference);
    }

    SECTION("invalid input") {
        CHECK_THROWS_AS(processor.transform(std::vector<h_float>(N - 1)), ConfigurationError);
        CHECK_THROWS_AS(processor.intensity(std::vector<h_complex>(3)), ConfigurationError);

        Observables::DirectionalSeries series(N);
        series.ortho.pop_back();
        CHECK_THROWS_AS(processor.polar_emission(series, 0.01), ConfigurationError);
        CHECK_THROWS_AS(processor.polar_emission(Observables::DirectionalSeries(N), 0.01, 1), ConfigurationError);
    }
}
